#pragma once
#include <beacon/core/errors/error_normalizer.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace Beacon {

class Backtrace {
public:
    // "function (file:line)" per frame, or just "function" without a location
    static std::vector<std::string> fromFrames(const Stacktrace& frames);

    /**
     * @brief Capture the calling thread's native stack
     * @param skip Innermost frames to drop (capture() itself is always dropped)
     * @param max_depth Upper bound on captured frames
     *
     * Symbol names come from dladdr() and are demangled; no file/line
     * information is available, so every frame has an empty location.
     */
    static Stacktrace capture(size_t skip = 0, size_t max_depth = 64);
};

} // namespace Beacon
