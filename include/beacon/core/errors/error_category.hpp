#pragma once
#include <cstdint>

namespace Beacon {

/**
 * Failure taxonomy used in operator-facing log lines.
 * None of these ever propagate into the host's call path.
 */
enum class ErrorCategory : uint8_t {
    CONFIG_INVALID = 0,       // Validation failed - degrade to no-op, warn
    BACKEND_UNAVAILABLE = 1,  // Backend not loaded/started - degrade, point at remediation
    SUBMISSION_FAILED = 2,    // Backend rejected or dropped a metric/transaction
    MALFORMED_ERROR = 3       // Normalizer fell back to a generic kind/message
};

inline const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::CONFIG_INVALID:      return "CONFIG_INVALID";
        case ErrorCategory::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
        case ErrorCategory::SUBMISSION_FAILED:   return "SUBMISSION_FAILED";
        case ErrorCategory::MALFORMED_ERROR:     return "MALFORMED_ERROR";
        default:                                 return "UNKNOWN";
    }
}

} // namespace Beacon
