#include <beacon/core/config/config_watcher.hpp>
#include <spdlog/spdlog.h>

namespace Beacon {

ConfigWatcher::ConfigWatcher(std::string path, std::chrono::milliseconds interval, ChangeCallback on_change)
    : path_(std::move(path)), interval_(interval), on_change_(std::move(on_change)) {
    last_write_ = currentWriteTime();
}

std::optional<std::filesystem::file_time_type> ConfigWatcher::currentWriteTime() const {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return std::nullopt;
    }
    return mtime;
}

bool ConfigWatcher::checkOnce() {
    const auto current = currentWriteTime();
    if (!current) {
        spdlog::debug("[ConfigWatcher] {} is not readable, keeping the current config", path_);
        return false;
    }
    if (last_write_ && *current == *last_write_) {
        return false;
    }

    last_write_ = current;
    spdlog::info("[ConfigWatcher] {} changed, reloading", path_);
    if (on_change_) {
        on_change_();
    }
    return true;
}

void ConfigWatcher::run(const std::atomic<bool>& running) {
    spdlog::debug("[ConfigWatcher] Watching {} every {}ms", path_, interval_.count());
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        woken_ = false;
    }
    while (running.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, interval_, [this, &running] {
                return woken_ || !running.load(std::memory_order_acquire);
            });
            woken_ = false;
        }
        if (!running.load(std::memory_order_acquire)) {
            break;
        }
        checkOnce();
    }
}

void ConfigWatcher::wake() {
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    woken_ = true;
    sleep_cv_.notify_all();
}

} // namespace Beacon
