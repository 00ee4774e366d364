#include <beacon/core/integrations/framework_integration.hpp>
#include <spdlog/spdlog.h>

namespace Beacon {

void IntegrationRegistry::add(std::shared_ptr<IFrameworkIntegration> integration) {
    if (!integration) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    integrations_.push_back(std::move(integration));
}

size_t IntegrationRegistry::attachPresent(Agent& agent) {
    std::vector<std::shared_ptr<IFrameworkIntegration>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& integration : integrations_) {
            const std::string name = integration->name();
            if (attached_.count(name) == 0 && integration->present()) {
                attached_.insert(name);
                pending.push_back(integration);
            }
        }
    }

    size_t attached = 0;
    for (const auto& integration : pending) {
        try {
            integration->attach(agent);
            ++attached;
            spdlog::info("[Integrations] Attached {}", integration->name());
        } catch (const std::exception& e) {
            spdlog::error("[Integrations] Failed to attach {}: {}", integration->name(), e.what());
        }
    }
    return attached;
}

size_t IntegrationRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return integrations_.size();
}

bool IntegrationRegistry::isAttached(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_.count(name) > 0;
}

} // namespace Beacon
