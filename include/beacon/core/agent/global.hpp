#pragma once
#include <beacon/core/agent/agent.hpp>
#include <memory>

namespace Beacon {

/**
 * Process-wide agent used by the free functions below. Replacing it does not
 * stop the previous agent; it is stopped when its last owner releases it.
 */
void setGlobalAgent(std::shared_ptr<Agent> agent);
std::shared_ptr<Agent> globalAgent();

// The free functions are no-ops returning true (or an empty id) when no agent is installed

template <typename Number>
bool setGauge(const std::string& key, Number value, const TagSet& tags = TagSet{}) {
    auto agent = globalAgent();
    return agent ? agent->setGauge(key, value, tags) : true;
}

template <typename Number = int>
bool incrementCounter(const std::string& key, Number amount = 1, const TagSet& tags = TagSet{}) {
    auto agent = globalAgent();
    return agent ? agent->incrementCounter(key, amount, tags) : true;
}

template <typename Number>
bool addDistributionValue(const std::string& key, Number value, const TagSet& tags = TagSet{}) {
    auto agent = globalAgent();
    return agent ? agent->addDistributionValue(key, value, tags) : true;
}

std::string sendError(const ErrorValue& error, const SendErrorOptions& options = SendErrorOptions{});

} // namespace Beacon
