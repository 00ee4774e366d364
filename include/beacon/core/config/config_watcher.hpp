#pragma once
#include <beacon/core/supervision/supervisor.hpp>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace Beacon {

/**
 * @class ConfigWatcher
 * @brief Polls a config file and fires a callback when it changes
 *
 * Supervised worker. The modification time seen at construction is the
 * baseline; a file that disappears is not a change, one that reappears is.
 */
class ConfigWatcher : public Worker {
public:
    using ChangeCallback = std::function<void()>;

    ConfigWatcher(std::string path, std::chrono::milliseconds interval, ChangeCallback on_change);

    // Compare against the last seen mtime; calls on_change and returns true on change
    bool checkOnce();

    const std::string& path() const { return path_; }

    std::string name() const override { return "config_watcher"; }
    void run(const std::atomic<bool>& running) override;
    void wake() override;

private:
    std::optional<std::filesystem::file_time_type> currentWriteTime() const;

    std::string path_;
    std::chrono::milliseconds interval_;
    ChangeCallback on_change_;
    std::optional<std::filesystem::file_time_type> last_write_;

    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
    bool woken_ = false;
};

} // namespace Beacon
