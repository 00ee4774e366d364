#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace Beacon {

struct ProbeConfig {
    bool enabled = true;
    std::chrono::milliseconds interval{60000};
};

struct WatchConfig {
    bool enabled = false;
    std::chrono::milliseconds interval{2000};
};

/**
 * @brief Agent settings bundle
 *
 * Built by ConfigLoader, validated by ConfigLifecycle and then published as
 * an immutable snapshot. Never mutated after publication.
 */
struct AgentConfig {
    bool active = false;
    std::string push_api_key;
    std::string app_name;
    std::string env = "development";
    std::string endpoint = "https://push.beacon.example";
    std::string hostname;

    std::string log_level = "info";
    bool debug = false;

    std::vector<std::string> ignore_errors;      // Error kinds never submitted
    std::vector<std::string> filter_parameters;  // Exported to the backend only

    ProbeConfig probes;
    WatchConfig config_watch;

    // File the config was read from; empty for environment-only configs
    std::string source_path;
};

} // namespace Beacon
