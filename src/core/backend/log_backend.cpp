#include <beacon/core/backend/log_backend.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace Beacon {

namespace {

const char* envOr(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

} // namespace

void LogBackend::start() {
    loaded_.store(true, std::memory_order_release);
    spdlog::info("[LogBackend] Started (app={}, env={}, endpoint={})",
                 envOr("_BEACON_APP_NAME", "-"),
                 envOr("_BEACON_APP_ENV", "-"),
                 envOr("_BEACON_PUSH_API_ENDPOINT", "-"));
}

void LogBackend::stop() {
    if (loaded_.exchange(false, std::memory_order_acq_rel)) {
        spdlog::info("[LogBackend] Stopped (metrics={}, errors={})",
                     metrics_written_.load(std::memory_order_relaxed),
                     errors_written_.load(std::memory_order_relaxed));
    }
}

bool LogBackend::setGauge(const std::string& key, double value, const EncodedTags& tags) {
    if (!loaded()) return false;
    metrics_written_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("[LogBackend] gauge {}={} tags={}", key, value, tags);
    return true;
}

bool LogBackend::incrementCounter(const std::string& key, double amount, const EncodedTags& tags) {
    if (!loaded()) return false;
    metrics_written_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("[LogBackend] counter {}+={} tags={}", key, amount, tags);
    return true;
}

bool LogBackend::addDistributionValue(const std::string& key, double value, const EncodedTags& tags) {
    if (!loaded()) return false;
    metrics_written_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("[LogBackend] distribution {}<-{} tags={}", key, value, tags);
    return true;
}

bool LogBackend::submitError(const ErrorSubmission& submission) {
    if (!loaded()) return false;
    errors_written_.fetch_add(1, std::memory_order_relaxed);

    spdlog::error("[LogBackend] {} transaction={} namespace={}: {}",
                  submission.kind, submission.transaction.id(),
                  toString(submission.transaction.getNamespace()), submission.message);
    for (const auto& line : submission.backtrace) {
        spdlog::error("[LogBackend]     at {}", line);
    }
    if (submission.context) {
        spdlog::error("[LogBackend]     request {} {}", submission.context->method, submission.context->path);
    }
    if (submission.tags != "{}") {
        spdlog::error("[LogBackend]     tags {}", submission.tags);
    }
    return true;
}

} // namespace Beacon
