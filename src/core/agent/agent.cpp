#include <beacon/core/agent/agent.hpp>
#include <beacon/core/config/loader.hpp>
#include <beacon/core/errors/error_category.hpp>
#include <beacon/core/probes/process_probe.hpp>
#include <beacon/core/version.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace Beacon {

namespace {

// Longest stop() waits for a reconfigure already in flight
constexpr std::chrono::milliseconds RECONFIGURE_DRAIN_TIMEOUT{5000};

std::unique_ptr<IBackend> requireBackend(std::unique_ptr<IBackend> backend) {
    if (!backend) {
        throw std::invalid_argument("Agent requires a backend");
    }
    return backend;
}

std::unique_ptr<ITransactionFactory> factoryOrDefault(std::unique_ptr<ITransactionFactory> factory) {
    if (!factory) {
        return std::make_unique<DefaultTransactionFactory>();
    }
    return factory;
}

} // namespace

// ============================================================================
// Constructor/Destructor
// ============================================================================

Agent::Agent(std::unique_ptr<IBackend> backend, ConfigSource source, AgentOptions options)
    : backend_(requireBackend(std::move(backend))),
      factory_(factoryOrDefault(std::move(options.transaction_factory))),
      lifecycle_(*backend_, std::move(source)),
      metrics_(*backend_, lifecycle_),
      pipeline_(*backend_, lifecycle_, *factory_),
      report_handler_(pipeline_),
      probes_(std::make_shared<ProbeScheduler>()),
      supervisor_(options.supervisor) {}

Agent::~Agent() noexcept {
    stop();
}

// ============================================================================
// Start/Stop
// ============================================================================

void Agent::start() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (started_) {
        spdlog::debug("[Agent] Already started");
        return;
    }

    spdlog::info("[Agent] Starting Beacon {} with backend '{}'", BEACON_VERSION, backend_->name());
    lifecycle_.initialize();
    report_handler_.add();
    integrations_.attachPresent(*this);

    const auto snapshot = lifecycle_.config();
    try {
        startWorkers(snapshot ? snapshot->config : AgentConfig{});
    } catch (const std::exception& e) {
        spdlog::error("[Agent] Failed to start background workers: {}", e.what());
    }

    started_ = true;
    spdlog::info("[Agent] Beacon started ({})", ConfigLifecycle::toString(lifecycle_.getState()));
}

void Agent::stop() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (!started_) {
        return;
    }

    spdlog::debug("Beacon stopping.");
    supervisor_.stop();
    report_handler_.remove();

    // A reconfigure still in flight would restart the backend after stop()
    if (!lifecycle_.waitForReconfigure(RECONFIGURE_DRAIN_TIMEOUT)) {
        spdlog::warn("[Agent] Reconfigure still running after {}ms, stopping anyway",
                     RECONFIGURE_DRAIN_TIMEOUT.count());
    }
    lifecycle_.stop();
    started_ = false;
}

bool Agent::isStarted() const {
    std::lock_guard<std::mutex> lock(start_mutex_);
    return started_;
}

// ============================================================================
// Private: Workers
// ============================================================================

void Agent::startWorkers(const AgentConfig& config) {
    if (config.probes.enabled && !probes_supervised_) {
        probes_->setInterval(config.probes.interval);
        supervisor_.addChild(probes_);
        probes_supervised_ = true;
    } else if (!config.probes.enabled) {
        spdlog::info("[Agent] Probes disabled by configuration");
    }

    if (config.config_watch.enabled && !watcher_) {
        if (config.source_path.empty()) {
            spdlog::warn("[Agent] [{}] config_watch is enabled but no config file was loaded",
                         toString(ErrorCategory::CONFIG_INVALID));
        } else {
            watcher_ = std::make_shared<ConfigWatcher>(config.source_path, config.config_watch.interval,
                                                       [this] { reconfigure(); });
            supervisor_.addChild(watcher_);
        }
    }

    supervisor_.start();

    // Registered after the timer is up
    if (config.probes.enabled && !probes_->hasProbe(ProcessProbe::NAME)) {
        probes_->registerProbe(ProcessProbe::NAME,
                               ProcessProbe(metrics_, ConfigLoader::effectiveHostname(config)));
    }
}

ConfigSource Agent::fileSource(const std::string& path) {
    return [path]() {
        if (path.empty()) {
            return ConfigLoader::loadFromEnvironment();
        }
        return ConfigLoader::loadConfig(path);
    };
}

} // namespace Beacon
