#include <beacon/core/config/config_cell.hpp>

namespace Beacon {

uint64_t ConfigCell::publish(AgentConfig config) {
    const uint64_t version = next_version_.fetch_add(1, std::memory_order_relaxed);
    std::shared_ptr<const ConfigSnapshot> next =
        std::make_shared<ConfigSnapshot>(ConfigSnapshot{version, std::move(config)});
    std::atomic_store_explicit(&current_, std::move(next), std::memory_order_release);
    return version;
}

void ConfigCell::clear() {
    std::atomic_store_explicit(&current_, std::shared_ptr<const ConfigSnapshot>(), std::memory_order_release);
}

} // namespace Beacon
