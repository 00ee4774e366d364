#pragma once
#include <beacon/core/encoding/scalar_value.hpp>
#include <exception>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Beacon {

struct SourceLocation {
    std::string file;
    int line = 0;
};

/**
 * One call-site. Frames without a known location keep an empty location
 * instead of being dropped, so frame counts stay meaningful.
 */
struct StackFrame {
    std::string function;                    // module/function descriptor
    std::optional<SourceLocation> location;
    std::optional<std::string> arguments;    // arguments or context, if captured
};

// Innermost frame first
using Stacktrace = std::vector<StackFrame>;

/**
 * Error record the caller already classified.
 */
struct StructuredError {
    std::string kind;
    std::string message;
};

/**
 * Anything a caller may report:
 * - std::exception_ptr: a native exception (std::current_exception(), make_exception_ptr)
 * - StructuredError:    an explicit kind/message pair
 * - ScalarValue:        an arbitrary plain value
 */
using ErrorValue = std::variant<std::exception_ptr, StructuredError, ScalarValue>;

struct NormalizedError {
    std::string kind;       // never empty
    std::string message;
    Stacktrace frames;
};

/**
 * @class ErrorNormalizer
 * @brief Collapse every ErrorValue shape into one NormalizedError
 */
class ErrorNormalizer {
public:
    static constexpr const char* GENERIC_KIND = "RuntimeError";

    /**
     * @brief Normalize an error value and its optional stack
     *
     * A missing stack is not an error: it is logged as deprecated usage and
     * an empty frame list is used.
     */
    static NormalizedError normalize(const ErrorValue& error,
                                     const std::optional<Stacktrace>& stack);

    /**
     * @brief Demangled C++ type name ("N3foo3BarE" -> "foo::Bar")
     */
    static std::string demangle(const char* mangled);

private:
    static NormalizedError fromException(const std::exception_ptr& error);
};

} // namespace Beacon
