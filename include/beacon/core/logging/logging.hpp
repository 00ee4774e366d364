#pragma once
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace Beacon {
namespace Logging {

/**
 * @brief Install the agent's log pattern on the default spdlog logger
 */
void setup();

/**
 * @brief Map a config level name (trace/debug/info/warn/error/off)
 */
std::optional<spdlog::level::level_enum> parseLevel(const std::string& name);

/**
 * @brief Apply the configured level; debug=true forces at least debug
 * @return false when the level name is unknown (level left unchanged)
 */
bool applyLevel(const std::string& name, bool debug);

} // namespace Logging
} // namespace Beacon
