#pragma once
#include <beacon/core/backend/backend.hpp>
#include <beacon/core/errors/error_normalizer.hpp>
#include <beacon/core/lifecycle/config_lifecycle.hpp>
#include <beacon/core/transaction/transaction.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace Beacon {

/**
 * Optional parts of an error report, with their defaults.
 */
struct SendErrorOptions {
    // Prepended as "prefix: message" when non-empty
    std::string prefix;

    // Innermost frame first. Leaving it unset is deprecated and logs a warning.
    std::optional<Stacktrace> stack;

    TagSet tags;

    std::optional<RequestContext> context;

    // Runs before normalization, e.g. to attach sample data
    std::function<void(Transaction&)> customize;

    Namespace ns = Namespace::HTTP_REQUEST;
};

/**
 * @class SubmissionPipeline
 * @brief Turns any error value into a submitted transaction
 *
 * Always creates its own transaction, so it works without any tracing
 * context. Runs entirely on the caller's thread and never throws.
 */
class SubmissionPipeline {
public:
    SubmissionPipeline(IBackend& backend, const ConfigLifecycle& lifecycle, ITransactionFactory& factory);

    /**
     * @brief Report an error
     * @return Id of the submitted transaction, or empty if nothing was submitted
     */
    std::string sendError(const ErrorValue& error, const SendErrorOptions& options = SendErrorOptions{});

    static std::string composeMessage(const std::string& prefix, const std::string& message);

    uint64_t submittedCount() const { return submitted_.load(std::memory_order_relaxed); }
    uint64_t failedCount() const { return failed_.load(std::memory_order_relaxed); }

private:
    bool isIgnored(const std::string& kind) const;

    IBackend& backend_;
    const ConfigLifecycle& lifecycle_;
    ITransactionFactory& factory_;
    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace Beacon
