#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace Beacon {

class Agent;

/**
 * @class IFrameworkIntegration
 * @brief Hook for a host framework the agent can instrument
 *
 * present() reports whether the framework is loaded in this process;
 * attach() wires it to the agent and runs at most once per registry.
 */
class IFrameworkIntegration {
public:
    virtual ~IFrameworkIntegration() = default;

    virtual std::string name() const = 0;
    virtual bool present() const = 0;
    virtual void attach(Agent& agent) = 0;
};

class IntegrationRegistry {
public:
    void add(std::shared_ptr<IFrameworkIntegration> integration);

    /**
     * @brief Attach every present integration not attached before
     * @return Number attached by this call
     *
     * An integration whose attach() throws is logged and not retried.
     */
    size_t attachPresent(Agent& agent);

    size_t size() const;
    bool isAttached(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<IFrameworkIntegration>> integrations_;
    std::unordered_set<std::string> attached_;
};

} // namespace Beacon
