#include <beacon/core/config/loader.hpp>
#include <beacon/core/logging/logging.hpp>
#include <beacon/core/version.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <unistd.h>

namespace Beacon {

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "active", "push_api_key", "name", "env", "endpoint", "hostname",
    "log_level", "debug", "ignore_errors", "filter_parameters",
    "probes", "config_watch"
};

template <typename T>
T readField(const YAML::Node& parent, const std::string& path, const char* key, const T& fallback) {
    const YAML::Node value = parent[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    try {
        return value.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid type for config field '" + path + "': " + e.what());
    }
}

std::chrono::milliseconds readInterval(const YAML::Node& parent, const std::string& path,
                                       std::chrono::milliseconds fallback) {
    const int64_t ms = readField<int64_t>(parent, path, "interval_ms", fallback.count());
    if (ms <= 0) {
        throw std::runtime_error("Invalid value for config field '" + path + "': must be positive, got " +
                                 std::to_string(ms));
    }
    return std::chrono::milliseconds(ms);
}

YAML::Node sectionOf(const YAML::Node& root, const char* key) {
    const YAML::Node section = root[key];
    if (section && !section.IsNull() && !section.IsMap()) {
        throw std::runtime_error(std::string("Invalid type for config section '") + key + "': expected a mapping");
    }
    return section;
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value) return std::nullopt;
    return std::string(value);
}

bool parseBool(const std::string& name, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::runtime_error("Invalid boolean in environment variable " + name + ": '" + value + "'");
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string::npos) end = value.size();
        std::string item = value.substr(start, end - start);
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) items.push_back(item);
        start = end + 1;
    }
    return items;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

// Environment wins over the file. A push API key in the environment turns
// the agent on unless `active` was set explicitly somewhere.
void applyEnvironment(AgentConfig& config, std::optional<bool> active_setting) {
    if (auto v = env("BEACON_PUSH_API_KEY")) config.push_api_key = *v;
    if (auto v = env("BEACON_APP_NAME")) config.app_name = *v;
    if (auto v = env("BEACON_APP_ENV")) config.env = *v;
    if (auto v = env("BEACON_PUSH_API_ENDPOINT")) config.endpoint = *v;
    if (auto v = env("BEACON_HOSTNAME")) config.hostname = *v;
    if (auto v = env("BEACON_LOG_LEVEL")) config.log_level = *v;
    if (auto v = env("BEACON_DEBUG")) config.debug = parseBool("BEACON_DEBUG", *v);
    if (auto v = env("BEACON_ENABLE_PROBES")) config.probes.enabled = parseBool("BEACON_ENABLE_PROBES", *v);
    if (auto v = env("BEACON_IGNORE_ERRORS")) config.ignore_errors = splitList(*v);
    if (auto v = env("BEACON_ACTIVE")) active_setting = parseBool("BEACON_ACTIVE", *v);

    config.active = active_setting.value_or(env("BEACON_PUSH_API_KEY").has_value());
}

void setEnv(const char* name, const std::string& value) {
    if (::setenv(name, value.c_str(), 1) != 0) {
        spdlog::warn("[ConfigLoader] Failed to export {}", name);
    }
}

} // namespace

AgentConfig ConfigLoader::loadConfig(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + filepath + ": " + e.what());
    }

    AgentConfig config;
    config.source_path = filepath;
    std::optional<bool> active_setting;

    if (root && !root.IsNull()) {
        if (!root.IsMap()) {
            throw std::runtime_error("Config file " + filepath + " must contain a mapping");
        }

        for (const auto& entry : root) {
            const std::string key = entry.first.as<std::string>();
            if (KNOWN_KEYS.count(key) == 0) {
                spdlog::warn("[ConfigLoader] Ignoring unknown config key '{}' in {}", key, filepath);
            }
        }

        if (root["active"] && !root["active"].IsNull()) {
            active_setting = readField<bool>(root, "active", "active", false);
        }
        config.push_api_key = readField<std::string>(root, "push_api_key", "push_api_key", config.push_api_key);
        config.app_name = readField<std::string>(root, "name", "name", config.app_name);
        config.env = readField<std::string>(root, "env", "env", config.env);
        config.endpoint = readField<std::string>(root, "endpoint", "endpoint", config.endpoint);
        config.hostname = readField<std::string>(root, "hostname", "hostname", config.hostname);
        config.log_level = readField<std::string>(root, "log_level", "log_level", config.log_level);
        config.debug = readField<bool>(root, "debug", "debug", config.debug);
        config.ignore_errors =
            readField<std::vector<std::string>>(root, "ignore_errors", "ignore_errors", config.ignore_errors);
        config.filter_parameters =
            readField<std::vector<std::string>>(root, "filter_parameters", "filter_parameters", config.filter_parameters);

        if (const YAML::Node probes = sectionOf(root, "probes"); probes && probes.IsMap()) {
            config.probes.enabled = readField<bool>(probes, "probes.enabled", "enabled", config.probes.enabled);
            config.probes.interval = readInterval(probes, "probes.interval_ms", config.probes.interval);
        }
        if (const YAML::Node watch = sectionOf(root, "config_watch"); watch && watch.IsMap()) {
            config.config_watch.enabled =
                readField<bool>(watch, "config_watch.enabled", "enabled", config.config_watch.enabled);
            config.config_watch.interval =
                readInterval(watch, "config_watch.interval_ms", config.config_watch.interval);
        }
    }

    applyEnvironment(config, active_setting);
    spdlog::debug("[ConfigLoader] Loaded {} (active={}, env={})", filepath, config.active, config.env);
    return config;
}

AgentConfig ConfigLoader::loadFromEnvironment() {
    AgentConfig config;
    applyEnvironment(config, std::nullopt);
    return config;
}

std::vector<std::string> ConfigLoader::validate(const AgentConfig& config) {
    std::vector<std::string> problems;

    if (config.push_api_key.empty()) {
        problems.emplace_back("push_api_key is missing");
    }
    if (config.endpoint.rfind("http://", 0) != 0 && config.endpoint.rfind("https://", 0) != 0) {
        problems.emplace_back("endpoint must start with http:// or https:// (got '" + config.endpoint + "')");
    }
    if (config.probes.interval.count() <= 0) {
        problems.emplace_back("probes.interval_ms must be positive");
    }
    if (config.config_watch.interval.count() <= 0) {
        problems.emplace_back("config_watch.interval_ms must be positive");
    }
    if (!Logging::parseLevel(config.log_level)) {
        problems.emplace_back("log_level '" + config.log_level + "' is not one of trace/debug/info/warn/error/off");
    }
    return problems;
}

std::string ConfigLoader::effectiveHostname(const AgentConfig& config) {
    if (!config.hostname.empty()) return config.hostname;
    char buffer[256] = {0};
    if (::gethostname(buffer, sizeof(buffer) - 1) == 0) {
        return std::string(buffer);
    }
    return std::string();
}

void ConfigLoader::writeToEnvironment(const AgentConfig& config) {
    setEnv("_BEACON_ACTIVE", config.active ? "true" : "false");
    setEnv("_BEACON_PUSH_API_KEY", config.push_api_key);
    setEnv("_BEACON_APP_NAME", config.app_name);
    setEnv("_BEACON_APP_ENV", config.env);
    setEnv("_BEACON_PUSH_API_ENDPOINT", config.endpoint);
    setEnv("_BEACON_HOSTNAME", effectiveHostname(config));
    setEnv("_BEACON_DEBUG_LOGGING", config.debug ? "true" : "false");
    setEnv("_BEACON_FILTER_PARAMETERS", joinList(config.filter_parameters));
    setEnv("_BEACON_LANGUAGE_INTEGRATION_VERSION", std::string("cpp-") + BEACON_VERSION);
}

} // namespace Beacon
