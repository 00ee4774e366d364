#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Beacon {

/**
 * @class Worker
 * @brief Long-running unit of work owned by a Supervisor
 *
 * run() should loop until @p running turns false. wake() must interrupt
 * any sleep inside run() so that stop() does not wait a full interval.
 */
class Worker {
public:
    virtual ~Worker() = default;

    virtual std::string name() const = 0;
    virtual void run(const std::atomic<bool>& running) = 0;
    virtual void wake() {}
};

enum class RestartPolicy : uint8_t {
    PERMANENT = 0,   // Restart whenever run() returns or throws
    TRANSIENT = 1,   // Restart only when run() throws
    TEMPORARY = 2    // Never restart
};

struct SupervisorConfig {
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{5000};
};

/**
 * @class Supervisor
 * @brief One-for-one supervision of independent workers
 *
 * Each child runs on its own thread. A child that crashes is restarted on
 * that same thread after an exponential backoff (initial_backoff doubling
 * up to max_backoff); siblings are not touched.
 */
class Supervisor {
public:
    explicit Supervisor(SupervisorConfig config = SupervisorConfig{});
    ~Supervisor() noexcept;

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Children added while running start immediately
    void addChild(std::shared_ptr<Worker> worker, RestartPolicy policy = RestartPolicy::PERMANENT);

    void setConfig(SupervisorConfig config);

    void start();
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    size_t size() const;

    // Restarts of the named child since it was added
    uint64_t restartCount(const std::string& name) const;

private:
    struct Child {
        std::shared_ptr<Worker> worker;
        RestartPolicy policy;
        std::thread thread;
        std::atomic<uint64_t> restarts{0};
    };

    void launch(Child& child);
    void supervise(Child& child);
    bool sleepFor(std::chrono::milliseconds duration);

    SupervisorConfig config_;
    std::atomic<bool> running_{false};

    mutable std::mutex children_mutex_;
    std::vector<std::unique_ptr<Child>> children_;

    // For interruptible backoff during shutdown
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace Beacon
