#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <beacon/core/agent/global.hpp>
#include <beacon/core/backend/log_backend.hpp>
#include <beacon/core/config/loader.hpp>
#include <beacon/core/errors/backtrace.hpp>
#include <beacon/core/logging/logging.hpp>
#include <beacon/core/version.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};
static std::atomic<bool> g_reload{false};

static void signalHandler(int signum) {
    if (signum == SIGHUP) {
        g_reload.store(true, std::memory_order_release);
        return;
    }
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    Beacon::Logging::setup();
    spdlog::info("Beacon agent demo v{} starting...", BEACON_VERSION);
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
}

struct Arguments {
    std::string config_path = "config/beacon.yaml";
    bool diagnose = false;
};

static Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--diagnose") == 0) {
            args.diagnose = true;
        } else {
            args.config_path = argv[i];
        }
    }
    return args;
}

// ============================================================================
// Diagnose
// ============================================================================

/**
 * Load, validate and start the backend once, printing what happened.
 * Returns EXIT_SUCCESS only if the agent would become active.
 */
static int diagnose(const std::string& config_path) {
    spdlog::info("Config file: {}", config_path);

    Beacon::AgentConfig config;
    try {
        config = Beacon::ConfigLoader::loadConfig(config_path);
    } catch (const std::exception& e) {
        spdlog::error("  config:   FAILED ({})", e.what());
        return EXIT_FAILURE;
    }
    spdlog::info("  config:   loaded");
    spdlog::info("  active:   {}", config.active);
    spdlog::info("  app:      {} ({})", config.app_name, config.env);
    spdlog::info("  endpoint: {}", config.endpoint);
    spdlog::info("  hostname: {}", Beacon::ConfigLoader::effectiveHostname(config));

    const auto problems = Beacon::ConfigLoader::validate(config);
    for (const auto& problem : problems) {
        spdlog::error("  invalid:  {}", problem);
    }
    if (!config.active || !problems.empty()) {
        return EXIT_FAILURE;
    }

    Beacon::ConfigLoader::writeToEnvironment(config);
    Beacon::LogBackend backend;
    try {
        backend.start();
    } catch (const std::exception& e) {
        spdlog::error("  backend:  FAILED to start ({})", e.what());
        return EXIT_FAILURE;
    }
    const bool loaded = backend.loaded();
    spdlog::info("  backend:  {} {}", backend.name(), loaded ? "loaded" : "NOT loaded");
    backend.stop();
    return loaded ? EXIT_SUCCESS : EXIT_FAILURE;
}

// ============================================================================
// Sample Traffic
// ============================================================================

static void reportWarmupFailure() {
    try {
        throw std::runtime_error("demo failure while warming caches");
    } catch (const std::exception&) {
        Beacon::SendErrorOptions options;
        options.prefix = "Warmup";
        options.ns = Beacon::Namespace::BACKGROUND;
        options.stack = Beacon::Backtrace::capture();
        options.tags = {{"phase", "warmup"}, {"attempt", 1}};
        Beacon::sendError(Beacon::ErrorValue{std::current_exception()}, options);
    }
}

static void emitSamples(std::chrono::steady_clock::time_point started) {
    using namespace std::chrono;
    const auto uptime = duration_cast<seconds>(steady_clock::now() - started).count();

    Beacon::setGauge("demo_uptime_seconds", uptime, {{"component", "demo"}});
    Beacon::incrementCounter("demo_loop_iterations");
    Beacon::addDistributionValue("demo_loop_latency_ms", 0.5 + static_cast<double>(uptime % 7),
                                 {{"component", "demo"}});
}

int main(int argc, char* argv[]) {
    setupLogging();
    const Arguments args = parseArguments(argc, argv);

    if (args.diagnose) {
        return diagnose(args.config_path);
    }
    setupSignalHandlers();

    std::shared_ptr<Beacon::Agent> agent;
    try {
        spdlog::info("Loading configuration from: {}", args.config_path);
        agent = std::make_shared<Beacon::Agent>(std::make_unique<Beacon::LogBackend>(),
                                                Beacon::Agent::fileSource(args.config_path));
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }
    Beacon::setGlobalAgent(agent);
    agent->start();

    reportWarmupFailure();

    spdlog::info("Beacon agent running. Send SIGHUP to reload, Ctrl+C to shutdown.");

    // Main loop
    const auto started = std::chrono::steady_clock::now();
    while (g_running.load(std::memory_order_acquire)) {
        if (g_reload.exchange(false, std::memory_order_acq_rel)) {
            spdlog::info("SIGHUP received, reloading configuration");
            agent->reconfigure();
        }
        emitSamples(started);
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    spdlog::info("=== SHUTDOWN SEQUENCE ===");
    Beacon::setGlobalAgent(nullptr);
    agent->stop();
    spdlog::info("=== SHUTDOWN COMPLETE ===");
    return EXIT_SUCCESS;
}
