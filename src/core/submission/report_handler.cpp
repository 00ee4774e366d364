#include <beacon/core/submission/report_handler.hpp>
#include <beacon/core/errors/backtrace.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace Beacon {

std::atomic<ReportHandler*> ReportHandler::active_{nullptr};

ReportHandler::ReportHandler(SubmissionPipeline& pipeline)
    : pipeline_(pipeline) {}

ReportHandler::~ReportHandler() noexcept {
    remove();
}

void ReportHandler::add() {
    if (installed()) {
        return;
    }
    ReportHandler* displaced = active_.exchange(this, std::memory_order_acq_rel);
    if (displaced != nullptr) {
        // Inherit the chain of the handler we replace
        previous_ = displaced->previous_;
        displaced->previous_ = nullptr;
        spdlog::warn("[ReportHandler] Replacing an already installed report handler");
    } else {
        previous_ = std::set_terminate(&ReportHandler::onTerminate);
    }
    spdlog::debug("[ReportHandler] Installed uncaught exception handler");
}

void ReportHandler::remove() {
    ReportHandler* expected = this;
    if (!active_.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel)) {
        return;
    }
    std::set_terminate(previous_);
    previous_ = nullptr;
    spdlog::debug("[ReportHandler] Removed uncaught exception handler");
}

std::string ReportHandler::report(std::exception_ptr error) {
    if (!error) {
        spdlog::warn("[ReportHandler] No exception in flight, nothing to report");
        return std::string();
    }

    SendErrorOptions options;
    options.prefix = "Uncaught exception";
    options.ns = Namespace::BACKGROUND;
    // Skip report() itself
    options.stack = Backtrace::capture(1);

    return pipeline_.sendError(ErrorValue{error}, options);
}

void ReportHandler::onTerminate() {
    ReportHandler* handler = active_.load(std::memory_order_acquire);
    std::terminate_handler previous = nullptr;

    if (handler != nullptr) {
        previous = handler->previous_;
        std::exception_ptr error = std::current_exception();
        if (error) {
            const std::string id = handler->report(error);
            spdlog::critical("[ReportHandler] Terminating on uncaught exception (transaction {})",
                             id.empty() ? "not submitted" : id);
        } else {
            spdlog::critical("[ReportHandler] Terminating without an active exception");
        }
        spdlog::default_logger()->flush();
    }

    if (previous != nullptr && previous != &ReportHandler::onTerminate) {
        previous();
    }
    std::abort();
}

} // namespace Beacon
