#include <beacon/core/logging/logging.hpp>

namespace Beacon {
namespace Logging {

void setup() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

std::optional<spdlog::level::level_enum> parseLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return std::nullopt;
}

bool applyLevel(const std::string& name, bool debug) {
    auto level = parseLevel(name);
    if (!level) {
        spdlog::warn("[Logging] Unknown log level '{}', keeping {}", name,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return false;
    }

    if (debug && *level > spdlog::level::debug) {
        level = spdlog::level::debug;
    }
    spdlog::set_level(*level);
    return true;
}

} // namespace Logging
} // namespace Beacon
