// ============================================================================
// SUPERVISOR UNIT TESTS
// ============================================================================
// Tests for one-for-one restarts, restart policies and the config watcher
// ============================================================================

#include <gtest/gtest.h>
#include <beacon/core/config/config_watcher.hpp>
#include <beacon/core/supervision/supervisor.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <thread>

using namespace Beacon;

namespace {

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

constexpr std::chrono::milliseconds WAIT{5000};

SupervisorConfig fastBackoff() {
    SupervisorConfig config;
    config.initial_backoff = std::chrono::milliseconds(1);
    config.max_backoff = std::chrono::milliseconds(4);
    return config;
}

// Crashes on its first `crashes` runs, then idles until stopped
class FlakyWorker : public Worker {
public:
    FlakyWorker(std::string name, int crashes) : name_(std::move(name)), crashes_(crashes) {}

    std::string name() const override { return name_; }

    void run(const std::atomic<bool>& running) override {
        if (runs.fetch_add(1) < crashes_) {
            throw std::runtime_error(name_ + " crashed");
        }
        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    std::atomic<int> runs{0};

private:
    std::string name_;
    int crashes_;
};

// Throws a non-std::exception value on its first run, then idles
class IntThrowingWorker : public Worker {
public:
    std::string name() const override { return "int_thrower"; }

    void run(const std::atomic<bool>& running) override {
        if (runs.fetch_add(1) == 0) {
            throw 7;
        }
        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    std::atomic<int> runs{0};
};

// Returns immediately every time
class OneShotWorker : public Worker {
public:
    std::string name() const override { return "one_shot"; }
    void run(const std::atomic<bool>&) override { runs.fetch_add(1); }

    std::atomic<int> runs{0};
};

} // namespace

// ============================================================================
// RESTART TESTS
// ============================================================================

TEST(Supervisor, CrashedWorkerIsRestarted) {
    auto flaky = std::make_shared<FlakyWorker>("flaky", 3);
    Supervisor supervisor(fastBackoff());
    supervisor.addChild(flaky);

    supervisor.start();
    EXPECT_TRUE(waitUntil([&] { return flaky->runs.load() >= 4; }, WAIT));
    supervisor.stop();

    EXPECT_EQ(supervisor.restartCount("flaky"), 3u);
}

TEST(Supervisor, CrashDoesNotAffectSiblings) {
    auto flaky = std::make_shared<FlakyWorker>("flaky", 2);
    auto steady = std::make_shared<FlakyWorker>("steady", 0);
    Supervisor supervisor(fastBackoff());
    supervisor.addChild(flaky);
    supervisor.addChild(steady);

    supervisor.start();
    EXPECT_TRUE(waitUntil([&] { return flaky->runs.load() >= 3; }, WAIT));
    supervisor.stop();

    EXPECT_EQ(steady->runs.load(), 1);
    EXPECT_EQ(supervisor.restartCount("steady"), 0u);
}

TEST(Supervisor, NonStandardExceptionIsRestartedLikeACrash) {
    auto thrower = std::make_shared<IntThrowingWorker>();
    auto steady = std::make_shared<FlakyWorker>("steady", 0);
    Supervisor supervisor(fastBackoff());
    supervisor.addChild(thrower, RestartPolicy::TRANSIENT);
    supervisor.addChild(steady);

    supervisor.start();
    EXPECT_TRUE(waitUntil([&] { return thrower->runs.load() >= 2; }, WAIT));
    supervisor.stop();

    EXPECT_EQ(supervisor.restartCount("int_thrower"), 1u);
    EXPECT_EQ(steady->runs.load(), 1);
}

TEST(Supervisor, TransientWorkerIsNotRestartedAfterNormalExit) {
    auto worker = std::make_shared<OneShotWorker>();
    Supervisor supervisor(fastBackoff());
    supervisor.addChild(worker, RestartPolicy::TRANSIENT);

    supervisor.start();
    EXPECT_TRUE(waitUntil([&] { return worker->runs.load() >= 1; }, WAIT));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    supervisor.stop();

    EXPECT_EQ(worker->runs.load(), 1);
}

TEST(Supervisor, TemporaryWorkerIsNotRestartedAfterCrash) {
    auto flaky = std::make_shared<FlakyWorker>("temporary", 5);
    Supervisor supervisor(fastBackoff());
    supervisor.addChild(flaky, RestartPolicy::TEMPORARY);

    supervisor.start();
    EXPECT_TRUE(waitUntil([&] { return flaky->runs.load() >= 1; }, WAIT));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    supervisor.stop();

    EXPECT_EQ(flaky->runs.load(), 1);
    EXPECT_EQ(supervisor.restartCount("temporary"), 0u);
}

// ============================================================================
// START / STOP TESTS
// ============================================================================

TEST(Supervisor, StopIsIdempotent) {
    Supervisor supervisor(fastBackoff());
    supervisor.addChild(std::make_shared<FlakyWorker>("idle", 0));

    supervisor.start();
    EXPECT_TRUE(supervisor.isRunning());
    supervisor.stop();
    supervisor.stop();
    EXPECT_FALSE(supervisor.isRunning());
}

TEST(Supervisor, ChildAddedWhileRunningStarts) {
    Supervisor supervisor(fastBackoff());
    supervisor.start();

    auto late = std::make_shared<FlakyWorker>("late", 0);
    supervisor.addChild(late);

    EXPECT_TRUE(waitUntil([&] { return late->runs.load() == 1; }, WAIT));
    EXPECT_EQ(supervisor.size(), 1u);
    supervisor.stop();
}

TEST(Supervisor, CanBeRestarted) {
    auto worker = std::make_shared<FlakyWorker>("restartable", 0);
    Supervisor supervisor(fastBackoff());
    supervisor.addChild(worker);

    supervisor.start();
    EXPECT_TRUE(waitUntil([&] { return worker->runs.load() == 1; }, WAIT));
    supervisor.stop();

    supervisor.start();
    EXPECT_TRUE(waitUntil([&] { return worker->runs.load() == 2; }, WAIT));
    supervisor.stop();
}

// ============================================================================
// CONFIG WATCHER TESTS
// ============================================================================

class ConfigWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("beacon_watch_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".yaml")).string();
        write("active: false\n");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& content) {
        std::ofstream out(path_, std::ios::trunc);
        out << content;
    }

    void touchLater() {
        auto mtime = std::filesystem::last_write_time(path_);
        std::filesystem::last_write_time(path_, mtime + std::chrono::seconds(5));
    }

    std::string path_;
};

TEST_F(ConfigWatcherTest, UnchangedFileIsNotReported) {
    int changes = 0;
    ConfigWatcher watcher(path_, std::chrono::milliseconds(10), [&] { ++changes; });

    EXPECT_FALSE(watcher.checkOnce());
    EXPECT_EQ(changes, 0);
}

TEST_F(ConfigWatcherTest, ModifiedFileIsReportedOnce) {
    int changes = 0;
    ConfigWatcher watcher(path_, std::chrono::milliseconds(10), [&] { ++changes; });

    write("active: true\n");
    touchLater();

    EXPECT_TRUE(watcher.checkOnce());
    EXPECT_FALSE(watcher.checkOnce());
    EXPECT_EQ(changes, 1);
}

TEST_F(ConfigWatcherTest, RemovedFileIsNotAChange) {
    int changes = 0;
    ConfigWatcher watcher(path_, std::chrono::milliseconds(10), [&] { ++changes; });

    std::filesystem::remove(path_);

    EXPECT_FALSE(watcher.checkOnce());
    EXPECT_EQ(changes, 0);
}

TEST_F(ConfigWatcherTest, SupervisedWatcherFiresCallback) {
    std::atomic<int> changes{0};
    auto watcher = std::make_shared<ConfigWatcher>(path_, std::chrono::milliseconds(10), [&] { changes.fetch_add(1); });
    Supervisor supervisor(fastBackoff());
    supervisor.addChild(watcher);
    supervisor.start();

    write("active: true\n");
    touchLater();

    EXPECT_TRUE(waitUntil([&] { return changes.load() == 1; }, WAIT));
    supervisor.stop();
}
