#pragma once
#include <beacon/core/submission/submission_pipeline.hpp>
#include <atomic>
#include <exception>

namespace Beacon {

/**
 * @class ReportHandler
 * @brief Reports uncaught exceptions before the process terminates
 *
 * add() installs a std::terminate handler that submits the in-flight
 * exception (BACKGROUND namespace, "Uncaught exception" prefix) and then
 * chains to the handler that was installed before. Only one ReportHandler
 * can be installed at a time; add() on a second instance replaces the first.
 */
class ReportHandler {
public:
    explicit ReportHandler(SubmissionPipeline& pipeline);
    ~ReportHandler() noexcept;

    ReportHandler(const ReportHandler&) = delete;
    ReportHandler& operator=(const ReportHandler&) = delete;

    void add();
    void remove();
    bool installed() const { return active_.load(std::memory_order_acquire) == this; }

    /**
     * @brief Submit one uncaught exception
     * @return Submitted transaction id, empty if nothing was submitted
     */
    std::string report(std::exception_ptr error);

private:
    [[noreturn]] static void onTerminate();

    static std::atomic<ReportHandler*> active_;

    SubmissionPipeline& pipeline_;
    std::terminate_handler previous_ = nullptr;
};

} // namespace Beacon
