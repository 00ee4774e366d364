#include <beacon/core/submission/submission_pipeline.hpp>
#include <beacon/core/errors/backtrace.hpp>
#include <beacon/core/errors/error_category.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace Beacon {

SubmissionPipeline::SubmissionPipeline(IBackend& backend, const ConfigLifecycle& lifecycle,
                                       ITransactionFactory& factory)
    : backend_(backend), lifecycle_(lifecycle), factory_(factory) {}

std::string SubmissionPipeline::sendError(const ErrorValue& error, const SendErrorOptions& options) {
    try {
        // "_" marks transactions the agent created itself
        Transaction transaction = factory_.create("_" + factory_.generateId(), options.ns);

        if (options.customize) {
            try {
                options.customize(transaction);
            } catch (const std::exception& e) {
                spdlog::warn("[SubmissionPipeline] [{}] Customization callback threw for transaction {}: {}",
                             toString(ErrorCategory::SUBMISSION_FAILED), transaction.id(), e.what());
            } catch (...) {
                spdlog::warn("[SubmissionPipeline] [{}] Customization callback threw a non-standard "
                             "exception for transaction {}",
                             toString(ErrorCategory::SUBMISSION_FAILED), transaction.id());
            }
        }

        NormalizedError normalized = ErrorNormalizer::normalize(error, options.stack);
        std::string message = composeMessage(options.prefix, normalized.message);

        if (!lifecycle_.isActive()) {
            spdlog::debug("[SubmissionPipeline] Agent inactive ({}), not submitting {}",
                          ConfigLifecycle::toString(lifecycle_.getState()), normalized.kind);
            return std::string();
        }
        if (isIgnored(normalized.kind)) {
            spdlog::debug("[SubmissionPipeline] Ignoring error of kind {}", normalized.kind);
            return std::string();
        }

        ErrorSubmission submission{
            std::move(transaction),
            normalized.kind,
            std::move(message),
            Backtrace::fromFrames(normalized.frames),
            TagEncoder::encode(options.tags),
            options.context
        };
        const std::string id = submission.transaction.id();

        bool accepted = false;
        try {
            accepted = backend_.submitError(submission);
        } catch (const std::exception& e) {
            spdlog::error("[SubmissionPipeline] Backend '{}' threw while submitting {}: {}",
                          backend_.name(), id, e.what());
        } catch (...) {
            spdlog::error("[SubmissionPipeline] Backend '{}' threw a non-standard exception while submitting {}",
                          backend_.name(), id);
        }

        if (!accepted) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[SubmissionPipeline] [{}] Transaction {} ({}) dropped by backend '{}'",
                         toString(ErrorCategory::SUBMISSION_FAILED), id, submission.kind, backend_.name());
            return std::string();
        }

        submitted_.fetch_add(1, std::memory_order_relaxed);
        return id;
    } catch (const std::exception& e) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[SubmissionPipeline] [{}] Could not build error report: {}",
                      toString(ErrorCategory::SUBMISSION_FAILED), e.what());
        return std::string();
    } catch (...) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[SubmissionPipeline] [{}] Could not build error report: non-standard exception",
                      toString(ErrorCategory::SUBMISSION_FAILED));
        return std::string();
    }
}

std::string SubmissionPipeline::composeMessage(const std::string& prefix, const std::string& message) {
    if (prefix.empty()) {
        return message;
    }
    return prefix + ": " + message;
}

bool SubmissionPipeline::isIgnored(const std::string& kind) const {
    const auto snapshot = lifecycle_.config();
    if (!snapshot) {
        return false;
    }
    const auto& ignored = snapshot->config.ignore_errors;
    return std::find(ignored.begin(), ignored.end(), kind) != ignored.end();
}

} // namespace Beacon
