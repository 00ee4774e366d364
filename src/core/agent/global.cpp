#include <beacon/core/agent/global.hpp>
#include <mutex>
#include <utility>

namespace Beacon {

namespace {

std::mutex& globalMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<Agent>& globalSlot() {
    static std::shared_ptr<Agent> agent;
    return agent;
}

} // namespace

void setGlobalAgent(std::shared_ptr<Agent> agent) {
    std::shared_ptr<Agent> previous;
    {
        std::lock_guard<std::mutex> lock(globalMutex());
        previous = std::exchange(globalSlot(), std::move(agent));
    }
    // previous is released outside the lock; its destructor may stop the agent
}

std::shared_ptr<Agent> globalAgent() {
    std::lock_guard<std::mutex> lock(globalMutex());
    return globalSlot();
}

std::string sendError(const ErrorValue& error, const SendErrorOptions& options) {
    auto agent = globalAgent();
    return agent ? agent->sendError(error, options) : std::string();
}

} // namespace Beacon
