#pragma once
#include <beacon/core/backend/backend.hpp>
#include <atomic>
#include <cstdint>

namespace Beacon {

/**
 * @class LogBackend
 * @brief In-process backend that writes every metric and error to the log
 *
 * Reads the endpoint and app name the lifecycle exported into the
 * environment, the same handoff a native transmitter uses.
 */
class LogBackend : public IBackend {
public:
    LogBackend() = default;
    ~LogBackend() override = default;

    void start() override;
    void stop() override;
    bool loaded() const override { return loaded_.load(std::memory_order_acquire); }

    bool setGauge(const std::string& key, double value, const EncodedTags& tags) override;
    bool incrementCounter(const std::string& key, double amount, const EncodedTags& tags) override;
    bool addDistributionValue(const std::string& key, double value, const EncodedTags& tags) override;
    bool submitError(const ErrorSubmission& submission) override;

    const char* name() const override { return "log"; }

    uint64_t metricsWritten() const { return metrics_written_.load(std::memory_order_relaxed); }
    uint64_t errorsWritten() const { return errors_written_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> loaded_{false};
    std::atomic<uint64_t> metrics_written_{0};
    std::atomic<uint64_t> errors_written_{0};
};

} // namespace Beacon
