#include <beacon/core/errors/backtrace.hpp>
#include <dlfcn.h>
#include <execinfo.h>
#include <spdlog/fmt/fmt.h>

namespace Beacon {

std::vector<std::string> Backtrace::fromFrames(const Stacktrace& frames) {
    std::vector<std::string> lines;
    lines.reserve(frames.size());
    for (const auto& frame : frames) {
        const std::string& function = frame.function.empty() ? std::string("<unknown>") : frame.function;
        if (frame.location) {
            lines.push_back(fmt::format("{} ({}:{})", function, frame.location->file, frame.location->line));
        } else {
            lines.push_back(function);
        }
    }
    return lines;
}

Stacktrace Backtrace::capture(size_t skip, size_t max_depth) {
    // +1 for this function's own frame
    std::vector<void*> addresses(max_depth + skip + 1);
    int depth = ::backtrace(addresses.data(), static_cast<int>(addresses.size()));

    Stacktrace frames;
    for (int i = static_cast<int>(skip) + 1; i < depth; ++i) {
        StackFrame frame;
        Dl_info info{};
        if (::dladdr(addresses[i], &info) != 0 && info.dli_sname != nullptr) {
            frame.function = ErrorNormalizer::demangle(info.dli_sname);
        } else {
            frame.function = fmt::format("{}", addresses[i]);
        }
        if (info.dli_fname != nullptr) {
            frame.arguments = std::string("module=") + info.dli_fname;
        }
        frames.push_back(std::move(frame));
    }
    return frames;
}

} // namespace Beacon
