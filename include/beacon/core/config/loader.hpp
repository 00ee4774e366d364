#pragma once
#include <beacon/core/config/agent_config.hpp>
#include <string>
#include <vector>

namespace Beacon {

class ConfigLoader {
public:
    /**
     * @brief Read a YAML config file, then apply BEACON_* environment overrides
     * @throws std::runtime_error on a missing file, bad YAML, wrong field types
     *         or invalid field values
     */
    static AgentConfig loadConfig(const std::string& filepath);

    /**
     * @brief Defaults plus BEACON_* environment overrides, no file
     */
    static AgentConfig loadFromEnvironment();

    /**
     * @brief Semantic checks for an active config
     * @return One message per problem; empty when valid
     */
    static std::vector<std::string> validate(const AgentConfig& config);

    /**
     * @brief Export the config as private _BEACON_* variables for the backend
     *
     * Uses setenv(), which is not thread-safe against concurrent getenv().
     */
    static void writeToEnvironment(const AgentConfig& config);

    // Configured hostname, or the machine's hostname when unset
    static std::string effectiveHostname(const AgentConfig& config);
};

} // namespace Beacon
