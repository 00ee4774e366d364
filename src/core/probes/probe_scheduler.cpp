#include <beacon/core/probes/probe_scheduler.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace Beacon {

ProbeScheduler::ProbeScheduler(std::chrono::milliseconds interval)
    : interval_ms_(interval.count()) {}

bool ProbeScheduler::registerProbe(const std::string& name, Probe probe) {
    if (!probe) {
        spdlog::warn("[ProbeScheduler] Ignoring empty probe '{}'", name);
        return false;
    }

    std::lock_guard<std::mutex> lock(probes_mutex_);
    auto result = probes_.insert_or_assign(name, std::move(probe));
    if (!result.second) {
        spdlog::warn("[ProbeScheduler] A probe named '{}' was already registered, replacing it", name);
        return false;
    }
    spdlog::debug("[ProbeScheduler] Registered probe '{}'", name);
    return true;
}

bool ProbeScheduler::unregisterProbe(const std::string& name) {
    std::lock_guard<std::mutex> lock(probes_mutex_);
    return probes_.erase(name) > 0;
}

bool ProbeScheduler::hasProbe(const std::string& name) const {
    std::lock_guard<std::mutex> lock(probes_mutex_);
    return probes_.count(name) > 0;
}

size_t ProbeScheduler::size() const {
    std::lock_guard<std::mutex> lock(probes_mutex_);
    return probes_.size();
}

void ProbeScheduler::setInterval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        spdlog::warn("[ProbeScheduler] Ignoring non-positive interval {}ms", interval.count());
        return;
    }
    interval_ms_.store(interval.count(), std::memory_order_relaxed);
}

std::chrono::milliseconds ProbeScheduler::interval() const {
    return std::chrono::milliseconds(interval_ms_.load(std::memory_order_relaxed));
}

size_t ProbeScheduler::tick() {
    std::vector<std::pair<std::string, Probe>> batch;
    {
        std::lock_guard<std::mutex> lock(probes_mutex_);
        batch.assign(probes_.begin(), probes_.end());
    }

    size_t completed = 0;
    for (auto& [name, probe] : batch) {
        try {
            probe();
            ++completed;
        } catch (const std::exception& e) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[ProbeScheduler] Probe '{}' failed: {}", name, e.what());
        } catch (...) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[ProbeScheduler] Probe '{}' failed with a non-standard exception", name);
        }
    }

    ticks_.fetch_add(1, std::memory_order_relaxed);
    return completed;
}

void ProbeScheduler::run(const std::atomic<bool>& running) {
    spdlog::debug("[ProbeScheduler] Timer started, interval {}ms", interval().count());
    {
        // A wake() aimed at a previous run must not fire the first tick early
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        woken_ = false;
    }
    while (running.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, interval(), [this, &running] {
                return woken_ || !running.load(std::memory_order_acquire);
            });
            woken_ = false;
        }
        if (!running.load(std::memory_order_acquire)) {
            break;
        }
        tick();
    }
    spdlog::debug("[ProbeScheduler] Timer stopped");
}

void ProbeScheduler::wake() {
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    woken_ = true;
    sleep_cv_.notify_all();
}

} // namespace Beacon
