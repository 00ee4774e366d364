#include <beacon/core/lifecycle/config_lifecycle.hpp>
#include <beacon/core/config/loader.hpp>
#include <beacon/core/errors/error_category.hpp>
#include <beacon/core/logging/logging.hpp>
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>

namespace Beacon {

ConfigLifecycle::ConfigLifecycle(IBackend& backend, ConfigSource source)
    : backend_(backend), source_(std::move(source)) {}

ConfigLifecycle::~ConfigLifecycle() noexcept {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    pending_cv_.wait(lock, [this]() { return pending_reconfigures_ == 0; });
}

LifecycleState ConfigLifecycle::initialize() {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    AgentConfig config;
    try {
        config = source_();
    } catch (const std::exception& e) {
        spdlog::warn("[ConfigLifecycle] [{}] Warning: could not load Beacon configuration ({}), "
                     "continuing with Beacon metrics disabled.",
                     Beacon::toString(ErrorCategory::CONFIG_INVALID), e.what());
        setState(LifecycleState::ENABLED_FAILED);
        return getState();
    } catch (...) {
        spdlog::warn("[ConfigLifecycle] [{}] Warning: could not load Beacon configuration (non-standard "
                     "exception), continuing with Beacon metrics disabled.",
                     Beacon::toString(ErrorCategory::CONFIG_INVALID));
        setState(LifecycleState::ENABLED_FAILED);
        return getState();
    }

    if (Logging::parseLevel(config.log_level)) {
        Logging::applyLevel(config.log_level, config.debug);
    }
    const bool active = config.active;
    const uint64_t version = cell_.publish(config);
    spdlog::debug("[ConfigLifecycle] Published config version {}", version);

    if (!active) {
        spdlog::info("[ConfigLifecycle] Beacon disabled.");
        setState(LifecycleState::DISABLED);
        return getState();
    }

    const auto problems = ConfigLoader::validate(config);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            spdlog::warn("[ConfigLifecycle] [{}] {}", Beacon::toString(ErrorCategory::CONFIG_INVALID), problem);
        }
        spdlog::warn("[ConfigLifecycle] Warning: No valid Beacon configuration found, "
                     "continuing with Beacon metrics disabled.");
        setState(LifecycleState::ENABLED_FAILED);
        return getState();
    }

    spdlog::debug("[ConfigLifecycle] Beacon starting.");
    ConfigLoader::writeToEnvironment(config);
    setState(LifecycleState::ENABLED_PENDING);

    try {
        backend_.start();
    } catch (const std::exception& e) {
        spdlog::error("[ConfigLifecycle] Backend '{}' threw during start: {}", backend_.name(), e.what());
    } catch (...) {
        spdlog::error("[ConfigLifecycle] Backend '{}' threw a non-standard exception during start", backend_.name());
    }

    if (backend_.loaded()) {
        spdlog::debug("[ConfigLifecycle] Beacon started.");
        setState(LifecycleState::ENABLED_ACTIVE);
    } else {
        spdlog::error("[ConfigLifecycle] [{}] Failed to start Beacon. Please run the diagnose task "
                      "(beacon_agent_demo --diagnose) and check that the '{}' backend is installed.",
                      Beacon::toString(ErrorCategory::BACKEND_UNAVAILABLE), backend_.name());
        setState(LifecycleState::ENABLED_FAILED);
    }
    return getState();
}

void ConfigLifecycle::reconfigure() {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        ++pending_reconfigures_;
    }
    reconfigure_count_.fetch_add(1, std::memory_order_relaxed);

    // A separate thread: the caller may be running inside something the
    // stop/initialize sequence needs to wait for.
    try {
        std::thread(&ConfigLifecycle::runReconfigure, this).detach();
    } catch (const std::system_error& e) {
        spdlog::error("[ConfigLifecycle] Could not spawn reconfigure worker: {}", e.what());
        std::lock_guard<std::mutex> lock(pending_mutex_);
        --pending_reconfigures_;
        pending_cv_.notify_all();
    }
}

void ConfigLifecycle::runReconfigure() {
    {
        std::lock_guard<std::mutex> sequence(reconfigure_mutex_);
        try {
            spdlog::info("[ConfigLifecycle] Reloading configuration...");
            stop();
            const LifecycleState state = initialize();
            spdlog::info("[ConfigLifecycle] Reconfigured, state={}", toString(state));
        } catch (const std::exception& e) {
            spdlog::error("[ConfigLifecycle] Reconfigure failed: {}", e.what());
        } catch (...) {
            spdlog::error("[ConfigLifecycle] Reconfigure failed: non-standard exception");
        }
    }

    // Notify under the lock: the destructor may run as soon as the count hits zero
    std::lock_guard<std::mutex> lock(pending_mutex_);
    --pending_reconfigures_;
    pending_cv_.notify_all();
}

void ConfigLifecycle::stop() {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    const LifecycleState current = getState();
    if (current != LifecycleState::UNINITIALIZED && current != LifecycleState::DISABLED) {
        try {
            backend_.stop();
        } catch (const std::exception& e) {
            spdlog::error("[ConfigLifecycle] Backend '{}' threw during stop: {}", backend_.name(), e.what());
        } catch (...) {
            spdlog::error("[ConfigLifecycle] Backend '{}' threw a non-standard exception during stop",
                          backend_.name());
        }
    }
    setState(LifecycleState::DISABLED);
}

bool ConfigLifecycle::waitForReconfigure(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    return pending_cv_.wait_for(lock, timeout, [this]() { return pending_reconfigures_ == 0; });
}

void ConfigLifecycle::setState(LifecycleState next) {
    const LifecycleState previous = state_.exchange(next, std::memory_order_acq_rel);
    if (previous == next) {
        spdlog::debug("[ConfigLifecycle] State already {}, no change", toString(next));
        return;
    }
    spdlog::info("[ConfigLifecycle] State transition: {} -> {}", toString(previous), toString(next));
}

const char* ConfigLifecycle::toString(LifecycleState state) {
    switch (state) {
        case LifecycleState::UNINITIALIZED:   return "UNINITIALIZED";
        case LifecycleState::DISABLED:        return "DISABLED";
        case LifecycleState::ENABLED_PENDING: return "ENABLED_PENDING";
        case LifecycleState::ENABLED_ACTIVE:  return "ENABLED_ACTIVE";
        case LifecycleState::ENABLED_FAILED:  return "ENABLED_FAILED";
        default:                              return "UNKNOWN";
    }
}

} // namespace Beacon
