#pragma once
#include <beacon/core/backend/backend.hpp>
#include <beacon/core/encoding/tag_encoder.hpp>
#include <beacon/core/lifecycle/config_lifecycle.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <type_traits>

namespace Beacon {

enum class MetricKind : uint8_t {
    GAUGE = 0,
    COUNTER = 1,
    DISTRIBUTION = 2
};

/**
 * @class MetricApi
 * @brief Ad-hoc gauges, counters and distribution values
 *
 * Every call returns true. When the lifecycle is not ENABLED_ACTIVE the
 * backend is not contacted at all; backend failures are logged and absorbed.
 * Integer inputs are widened to double before transmission, which is exact
 * up to 2^53.
 */
class MetricApi {
public:
    MetricApi(IBackend& backend, const ConfigLifecycle& lifecycle);

    template <typename Number>
    bool setGauge(const std::string& key, Number value, const TagSet& tags = TagSet{}) {
        return emit(MetricKind::GAUGE, key, toDouble(value), tags);
    }

    template <typename Number = int>
    bool incrementCounter(const std::string& key, Number amount = 1, const TagSet& tags = TagSet{}) {
        return emit(MetricKind::COUNTER, key, toDouble(amount), tags);
    }

    template <typename Number>
    bool addDistributionValue(const std::string& key, Number value, const TagSet& tags = TagSet{}) {
        return emit(MetricKind::DISTRIBUTION, key, toDouble(value), tags);
    }

    // Calls the backend rejected or that threw
    uint64_t failedCount() const { return failed_.load(std::memory_order_relaxed); }

    static const char* toString(MetricKind kind);

private:
    template <typename Number>
    static double toDouble(Number value) {
        static_assert(std::is_arithmetic<Number>::value && !std::is_same<Number, bool>::value,
                      "metric values must be integers or floating point numbers");
        return static_cast<double>(value);
    }

    bool emit(MetricKind kind, const std::string& key, double value, const TagSet& tags);

    IBackend& backend_;
    const ConfigLifecycle& lifecycle_;
    std::atomic<uint64_t> failed_{0};
};

} // namespace Beacon
