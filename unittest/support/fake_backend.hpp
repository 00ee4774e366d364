#pragma once

#include <beacon/core/backend/backend.hpp>
#include <beacon/core/config/agent_config.hpp>
#include <beacon/core/lifecycle/config_lifecycle.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace BeaconTest {

struct MetricCall {
    std::string method;
    std::string key;
    double value;
    Beacon::EncodedTags tags;
};

/**
 * In-memory backend recording every call.
 */
class FakeBackend : public Beacon::IBackend {
public:
    void start() override {
        starts.fetch_add(1);
        if (throw_on_start.load()) {
            throw std::runtime_error("backend library missing");
        }
        loaded_.store(load_on_start.load());
    }

    void stop() override {
        stops.fetch_add(1);
        loaded_.store(false);
    }

    bool loaded() const override { return loaded_.load(); }

    bool setGauge(const std::string& key, double value, const Beacon::EncodedTags& tags) override {
        return record("setGauge", key, value, tags);
    }

    bool incrementCounter(const std::string& key, double amount, const Beacon::EncodedTags& tags) override {
        return record("incrementCounter", key, amount, tags);
    }

    bool addDistributionValue(const std::string& key, double value, const Beacon::EncodedTags& tags) override {
        return record("addDistributionValue", key, value, tags);
    }

    bool submitError(const Beacon::ErrorSubmission& submission) override {
        if (throw_on_call.load()) {
            throw std::runtime_error("transmitter crashed");
        }
        if (throw_int_on_call.load()) {
            throw 7;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        submissions_.push_back(submission);
        return accept.load();
    }

    const char* name() const override { return "fake"; }

    std::vector<MetricCall> metricCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return metric_calls_;
    }

    std::vector<Beacon::ErrorSubmission> submissions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submissions_;
    }

    size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return metric_calls_.size() + submissions_.size();
    }

    std::atomic<int> starts{0};
    std::atomic<int> stops{0};

    std::atomic<bool> load_on_start{true};
    std::atomic<bool> throw_on_start{false};
    std::atomic<bool> accept{true};
    std::atomic<bool> throw_on_call{false};
    // Throws an int instead of a std::exception
    std::atomic<bool> throw_int_on_call{false};

private:
    bool record(const char* method, const std::string& key, double value, const Beacon::EncodedTags& tags) {
        if (throw_on_call.load()) {
            throw std::runtime_error("transmitter crashed");
        }
        if (throw_int_on_call.load()) {
            throw 7;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        metric_calls_.push_back(MetricCall{method, key, value, tags});
        return accept.load();
    }

    std::atomic<bool> loaded_{false};
    mutable std::mutex mutex_;
    std::vector<MetricCall> metric_calls_;
    std::vector<Beacon::ErrorSubmission> submissions_;
};

// Config that passes validation and makes the agent active
inline Beacon::AgentConfig activeConfig() {
    Beacon::AgentConfig config;
    config.active = true;
    config.push_api_key = "test-key";
    config.app_name = "unittest-app";
    config.env = "test";
    config.hostname = "test-host";
    config.probes.enabled = false;
    return config;
}

inline Beacon::ConfigSource fixedSource(const Beacon::AgentConfig& config) {
    return [config]() { return config; };
}

} // namespace BeaconTest
