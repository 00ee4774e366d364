#pragma once
#include <beacon/core/backend/backend.hpp>
#include <beacon/core/config/config_watcher.hpp>
#include <beacon/core/integrations/framework_integration.hpp>
#include <beacon/core/lifecycle/config_lifecycle.hpp>
#include <beacon/core/metrics/metric_api.hpp>
#include <beacon/core/probes/probe_scheduler.hpp>
#include <beacon/core/submission/report_handler.hpp>
#include <beacon/core/submission/submission_pipeline.hpp>
#include <beacon/core/supervision/supervisor.hpp>
#include <beacon/core/transaction/transaction.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace Beacon {

struct AgentOptions {
    // nullptr selects DefaultTransactionFactory
    std::unique_ptr<ITransactionFactory> transaction_factory;
    SupervisorConfig supervisor;
};

/**
 * @class Agent
 * @brief Owns every agent component and wires them together
 *
 * start():
 *   1. ConfigLifecycle::initialize()
 *   2. install the uncaught exception handler
 *   3. attach present framework integrations
 *   4. start the supervisor (probe timer, optional config watcher)
 *   5. register the default "process" probe
 *
 * stop() undoes this in reverse order and is idempotent. Nothing here
 * throws into the host.
 */
class Agent {
public:
    Agent(std::unique_ptr<IBackend> backend, ConfigSource source, AgentOptions options = AgentOptions{});
    ~Agent() noexcept;

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    void start();
    void stop();

    // Detached restart of the backend with a freshly loaded config
    void reconfigure() { lifecycle_.reconfigure(); }

    bool isStarted() const;
    bool isActive() const { return lifecycle_.isActive(); }

    template <typename Number>
    bool setGauge(const std::string& key, Number value, const TagSet& tags = TagSet{}) {
        return metrics_.setGauge(key, value, tags);
    }

    template <typename Number = int>
    bool incrementCounter(const std::string& key, Number amount = 1, const TagSet& tags = TagSet{}) {
        return metrics_.incrementCounter(key, amount, tags);
    }

    template <typename Number>
    bool addDistributionValue(const std::string& key, Number value, const TagSet& tags = TagSet{}) {
        return metrics_.addDistributionValue(key, value, tags);
    }

    std::string sendError(const ErrorValue& error, const SendErrorOptions& options = SendErrorOptions{}) {
        return pipeline_.sendError(error, options);
    }

    IBackend& backend() { return *backend_; }
    ConfigLifecycle& lifecycle() { return lifecycle_; }
    MetricApi& metrics() { return metrics_; }
    SubmissionPipeline& submissions() { return pipeline_; }
    ReportHandler& reportHandler() { return report_handler_; }
    ProbeScheduler& probes() { return *probes_; }
    Supervisor& supervisor() { return supervisor_; }
    IntegrationRegistry& integrations() { return integrations_; }

    // Loads the YAML file at path, or only the environment when path is empty
    static ConfigSource fileSource(const std::string& path);

private:
    void startWorkers(const AgentConfig& config);

    std::unique_ptr<IBackend> backend_;
    std::unique_ptr<ITransactionFactory> factory_;
    ConfigLifecycle lifecycle_;
    MetricApi metrics_;
    SubmissionPipeline pipeline_;
    ReportHandler report_handler_;
    std::shared_ptr<ProbeScheduler> probes_;
    std::shared_ptr<ConfigWatcher> watcher_;
    Supervisor supervisor_;
    IntegrationRegistry integrations_;

    mutable std::mutex start_mutex_;
    bool started_ = false;
    bool probes_supervised_ = false;
};

} // namespace Beacon
