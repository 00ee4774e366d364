#include <beacon/core/metrics/metric_api.hpp>
#include <beacon/core/errors/error_category.hpp>
#include <spdlog/spdlog.h>

namespace Beacon {

MetricApi::MetricApi(IBackend& backend, const ConfigLifecycle& lifecycle)
    : backend_(backend), lifecycle_(lifecycle) {}

bool MetricApi::emit(MetricKind kind, const std::string& key, double value, const TagSet& tags) {
    if (!lifecycle_.isActive()) {
        return true;
    }

    if (key.empty()) {
        spdlog::warn("[MetricApi] Dropping {} with an empty key", toString(kind));
        return true;
    }

    bool accepted = false;
    try {
        const EncodedTags encoded = TagEncoder::encode(tags);
        switch (kind) {
            case MetricKind::GAUGE:
                accepted = backend_.setGauge(key, value, encoded);
                break;
            case MetricKind::COUNTER:
                accepted = backend_.incrementCounter(key, value, encoded);
                break;
            case MetricKind::DISTRIBUTION:
                accepted = backend_.addDistributionValue(key, value, encoded);
                break;
        }
    } catch (const std::exception& e) {
        spdlog::error("[MetricApi] [{}] {} '{}' threw in backend '{}': {}",
                      Beacon::toString(ErrorCategory::SUBMISSION_FAILED), toString(kind), key,
                      backend_.name(), e.what());
        accepted = false;
    } catch (...) {
        spdlog::error("[MetricApi] [{}] {} '{}' threw a non-standard exception in backend '{}'",
                      Beacon::toString(ErrorCategory::SUBMISSION_FAILED), toString(kind), key,
                      backend_.name());
        accepted = false;
    }

    if (!accepted) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[MetricApi] [{}] Backend '{}' dropped {} '{}'={}",
                     Beacon::toString(ErrorCategory::SUBMISSION_FAILED), backend_.name(),
                     toString(kind), key, value);
    }
    return true;
}

const char* MetricApi::toString(MetricKind kind) {
    switch (kind) {
        case MetricKind::GAUGE:        return "gauge";
        case MetricKind::COUNTER:      return "counter";
        case MetricKind::DISTRIBUTION: return "distribution";
        default:                       return "unknown";
    }
}

} // namespace Beacon
