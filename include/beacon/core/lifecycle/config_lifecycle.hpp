#pragma once
#include <beacon/core/backend/backend.hpp>
#include <beacon/core/config/config_cell.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace Beacon {

/**
 * Lifecycle of the backend connection
 *
 *   UNINITIALIZED -> DISABLED                 (not administratively active)
 *                 -> ENABLED_PENDING          (valid config, backend starting)
 *                       -> ENABLED_ACTIVE     (backend loaded)
 *                       -> ENABLED_FAILED     (backend failed to load)
 *                 -> ENABLED_FAILED           (active but config invalid)
 *
 * Only ENABLED_ACTIVE forwards metrics and errors to the backend.
 */
enum class LifecycleState : uint8_t {
    UNINITIALIZED = 0,
    DISABLED = 1,
    ENABLED_PENDING = 2,
    ENABLED_ACTIVE = 3,
    ENABLED_FAILED = 4
};

// Produces a fresh, unvalidated config; may throw std::exception
using ConfigSource = std::function<AgentConfig()>;

/**
 * @class ConfigLifecycle
 * @brief Owns the config cell and the initialize/reconfigure/stop sequence
 *
 * Readers (MetricApi, SubmissionPipeline) only call getState() and config(),
 * both lock-free.
 */
class ConfigLifecycle {
public:
    ConfigLifecycle(IBackend& backend, ConfigSource source);

    // Waits for in-flight reconfigure workers
    ~ConfigLifecycle() noexcept;

    ConfigLifecycle(const ConfigLifecycle&) = delete;
    ConfigLifecycle& operator=(const ConfigLifecycle&) = delete;

    /**
     * @brief Load + validate the config and start the backend
     *
     * Never throws: an invalid or unreadable config degrades to
     * ENABLED_FAILED with a warning.
     */
    LifecycleState initialize();

    /**
     * @brief Restart the backend with a freshly loaded config
     *
     * Runs stop() then initialize() on a new detached thread and returns
     * immediately. Safe to call from a config-change callback, a worker
     * owned by the agent, or while another reconfigure is running
     * (they execute one after another).
     *
     * The new thread rewrites the _BEACON_* environment variables with
     * setenv(). POSIX does not make that safe against concurrent getenv()
     * from other threads, so hosts that read the environment off the main
     * thread should not reconfigure while doing so.
     */
    void reconfigure();

    /**
     * @brief Stop the backend; idempotent, leaves the lifecycle DISABLED
     */
    void stop();

    LifecycleState getState() const { return state_.load(std::memory_order_acquire); }
    bool isActive() const { return getState() == LifecycleState::ENABLED_ACTIVE; }

    // Last loaded config; nullptr before the first successful load
    std::shared_ptr<const ConfigSnapshot> config() const { return cell_.snapshot(); }

    /**
     * @brief Block until no reconfigure worker is running
     * @return false on timeout
     */
    bool waitForReconfigure(std::chrono::milliseconds timeout) const;

    uint64_t reconfigureCount() const { return reconfigure_count_.load(std::memory_order_relaxed); }

    static const char* toString(LifecycleState state);

private:
    void setState(LifecycleState next);
    void runReconfigure();

    IBackend& backend_;
    ConfigSource source_;
    ConfigCell cell_;
    std::atomic<LifecycleState> state_{LifecycleState::UNINITIALIZED};

    // Serializes initialize()/stop() bodies
    std::mutex transition_mutex_;
    // Serializes whole reconfigure sequences
    std::mutex reconfigure_mutex_;

    mutable std::mutex pending_mutex_;
    mutable std::condition_variable pending_cv_;
    size_t pending_reconfigures_ = 0;
    std::atomic<uint64_t> reconfigure_count_{0};
};

} // namespace Beacon
