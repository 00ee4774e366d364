#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>

namespace BeaconTest {

/**
 * Routes the default spdlog logger into a string for the lifetime of the
 * object, restoring the previous logger afterwards.
 */
class LogCapture {
public:
    LogCapture()
        : previous_(spdlog::default_logger()),
          previous_level_(spdlog::get_level()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        sink->set_pattern("[%l] %v");
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger);
    }

    ~LogCapture() {
        spdlog::set_default_logger(previous_);
        spdlog::set_level(previous_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string text() const { return stream_.str(); }

    bool contains(const std::string& needle) const {
        return text().find(needle) != std::string::npos;
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> previous_;
    spdlog::level::level_enum previous_level_;
};

} // namespace BeaconTest
