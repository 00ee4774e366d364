#include <beacon/core/errors/error_normalizer.hpp>
#include <beacon/core/errors/error_category.hpp>
#include <spdlog/spdlog.h>
#include <cxxabi.h>
#include <cstdlib>
#include <memory>
#include <typeinfo>

namespace Beacon {

NormalizedError ErrorNormalizer::normalize(const ErrorValue& error,
                                           const std::optional<Stacktrace>& stack) {
    NormalizedError normalized;

    if (const auto* exception = std::get_if<std::exception_ptr>(&error)) {
        normalized = fromException(*exception);
    } else if (const auto* structured = std::get_if<StructuredError>(&error)) {
        normalized.kind = structured->kind;
        normalized.message = structured->message;
    } else {
        normalized.kind = GENERIC_KIND;
        normalized.message = std::get<ScalarValue>(error).toString();
    }

    if (normalized.kind.empty()) {
        normalized.kind = GENERIC_KIND;
    }

    if (stack) {
        normalized.frames = *stack;
    } else {
        spdlog::warn("[ErrorNormalizer] Sending an error without a stack trace is deprecated "
                     "and defaults to an empty stack trace. Pass a stack trace or an empty list.");
    }
    return normalized;
}

NormalizedError ErrorNormalizer::fromException(const std::exception_ptr& error) {
    NormalizedError normalized;
    normalized.kind = GENERIC_KIND;

    if (!error) {
        normalized.message = "null exception";
        spdlog::warn("[ErrorNormalizer] [{}] Empty exception_ptr reported",
                     toString(ErrorCategory::MALFORMED_ERROR));
        return normalized;
    }

    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        normalized.kind = demangle(typeid(e).name());
        normalized.message = e.what();
    } catch (const std::string& s) {
        normalized.message = s;
    } catch (const char* s) {
        normalized.message = s ? s : "";
    } catch (...) {
        normalized.message = "unknown exception";
        spdlog::warn("[ErrorNormalizer] [{}] Exception of unknown type reported, using {}",
                     toString(ErrorCategory::MALFORMED_ERROR), GENERIC_KIND);
    }
    return normalized;
}

std::string ErrorNormalizer::demangle(const char* mangled) {
    if (!mangled) return std::string();

    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
    return std::string(mangled);
}

} // namespace Beacon
