#pragma once
#include <beacon/core/supervision/supervisor.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace Beacon {

using Probe = std::function<void()>;

/**
 * @class ProbeScheduler
 * @brief Runs every registered probe once per interval
 *
 * Supervised worker. Probes run outside the registry lock, so a probe may
 * register or unregister probes (changes apply from the next tick). A
 * throwing probe is logged and does not affect the others.
 */
class ProbeScheduler : public Worker {
public:
    explicit ProbeScheduler(std::chrono::milliseconds interval = std::chrono::milliseconds(60000));

    /**
     * @brief Register a probe under a unique name
     * @return true if the name was new; false if an existing probe was replaced
     */
    bool registerProbe(const std::string& name, Probe probe);
    bool unregisterProbe(const std::string& name);
    bool hasProbe(const std::string& name) const;
    size_t size() const;

    void setInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds interval() const;

    // Run every probe once; returns how many completed without throwing
    size_t tick();

    uint64_t tickCount() const { return ticks_.load(std::memory_order_relaxed); }
    uint64_t failureCount() const { return failures_.load(std::memory_order_relaxed); }

    std::string name() const override { return "probes"; }
    void run(const std::atomic<bool>& running) override;
    void wake() override;

private:
    mutable std::mutex probes_mutex_;
    std::map<std::string, Probe> probes_;

    std::atomic<int64_t> interval_ms_;
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failures_{0};

    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
    bool woken_ = false;
};

} // namespace Beacon
