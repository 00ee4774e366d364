#pragma once
#include <beacon/core/config/agent_config.hpp>
#include <atomic>
#include <cstdint>
#include <memory>

namespace Beacon {

struct ConfigSnapshot {
    uint64_t version;
    AgentConfig config;
};

/**
 * @class ConfigCell
 * @brief Single owned, versioned config slot with atomic snapshot swap
 *
 * Writers build a complete snapshot and swap the pointer; readers get a
 * shared_ptr that stays valid (and unchanged) for as long as they hold it.
 * Reads never block and never observe a partially written config.
 */
class ConfigCell {
public:
    ConfigCell() = default;
    ConfigCell(const ConfigCell&) = delete;
    ConfigCell& operator=(const ConfigCell&) = delete;

    // nullptr until the first publish()
    std::shared_ptr<const ConfigSnapshot> snapshot() const {
        return std::atomic_load_explicit(&current_, std::memory_order_acquire);
    }

    /**
     * @brief Replace the config wholesale
     * @return Version of the published snapshot (starts at 1)
     */
    uint64_t publish(AgentConfig config);

    void clear();

private:
    std::shared_ptr<const ConfigSnapshot> current_;
    std::atomic<uint64_t> next_version_{1};
};

} // namespace Beacon
