#include <beacon/core/supervision/supervisor.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace Beacon {

// ============================================================================
// Constructor/Destructor
// ============================================================================

Supervisor::Supervisor(SupervisorConfig config)
    : config_(config) {}

Supervisor::~Supervisor() noexcept {
    stop();
}

// ============================================================================
// Children
// ============================================================================

void Supervisor::addChild(std::shared_ptr<Worker> worker, RestartPolicy policy) {
    if (!worker) {
        spdlog::warn("[Supervisor] Ignoring null worker");
        return;
    }

    auto child = std::make_unique<Child>();
    child->worker = std::move(worker);
    child->policy = policy;

    std::lock_guard<std::mutex> lock(children_mutex_);
    children_.push_back(std::move(child));
    if (isRunning()) {
        launch(*children_.back());
    }
}

void Supervisor::setConfig(SupervisorConfig config) {
    if (isRunning()) {
        spdlog::warn("[Supervisor] Cannot change backoff while running");
        return;
    }
    config_ = config;
}

size_t Supervisor::size() const {
    std::lock_guard<std::mutex> lock(children_mutex_);
    return children_.size();
}

uint64_t Supervisor::restartCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(children_mutex_);
    for (const auto& child : children_) {
        if (child->worker->name() == name) {
            return child->restarts.load(std::memory_order_relaxed);
        }
    }
    return 0;
}

// ============================================================================
// Thread Control
// ============================================================================

void Supervisor::start() {
    std::lock_guard<std::mutex> lock(children_mutex_);
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    for (auto& child : children_) {
        launch(*child);
    }
    spdlog::debug("[Supervisor] Started {} workers", children_.size());
}

void Supervisor::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        sleep_cv_.notify_all();
    }

    std::lock_guard<std::mutex> lock(children_mutex_);
    for (auto& child : children_) {
        child->worker->wake();
    }
    for (auto& child : children_) {
        if (child->thread.joinable()) {
            child->thread.join();
        }
    }
    spdlog::debug("[Supervisor] Stopped {} workers", children_.size());
}

// ============================================================================
// Private: Supervision loop
// ============================================================================

void Supervisor::launch(Child& child) {
    if (child.thread.joinable()) {
        child.thread.join();
    }
    child.thread = std::thread(&Supervisor::supervise, this, std::ref(child));
}

void Supervisor::supervise(Child& child) {
    const std::string name = child.worker->name();
    auto backoff = config_.initial_backoff;

    while (isRunning()) {
        const auto started = std::chrono::steady_clock::now();
        bool crashed = false;
        try {
            child.worker->run(running_);
        } catch (const std::exception& e) {
            crashed = true;
            spdlog::error("[Supervisor] Worker '{}' crashed: {}", name, e.what());
        } catch (...) {
            crashed = true;
            spdlog::error("[Supervisor] Worker '{}' crashed with a non-standard exception", name);
        }

        if (!isRunning()) {
            break;
        }
        if (child.policy == RestartPolicy::TEMPORARY ||
            (child.policy == RestartPolicy::TRANSIENT && !crashed)) {
            spdlog::info("[Supervisor] Worker '{}' finished, not restarting", name);
            break;
        }

        // A worker that stayed up longer than the backoff ceiling starts over
        if (std::chrono::steady_clock::now() - started > config_.max_backoff) {
            backoff = config_.initial_backoff;
        }

        child.restarts.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[Supervisor] Restarting worker '{}' in {}ms", name, backoff.count());
        if (!sleepFor(backoff)) {
            break;
        }
        backoff = std::min(backoff * 2, config_.max_backoff);
    }
}

bool Supervisor::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, duration, [this] { return !isRunning(); });
    return isRunning();
}

} // namespace Beacon
