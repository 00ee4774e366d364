#pragma once
#include <beacon/core/encoding/tag_encoder.hpp>
#include <beacon/core/transaction/transaction.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Beacon {

/**
 * Request/connection data captured by the host framework, if any.
 */
struct RequestContext {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> params;
};

/**
 * Everything the backend receives for one reported error.
 */
struct ErrorSubmission {
    Transaction transaction;
    std::string kind;
    std::string message;
    std::vector<std::string> backtrace;
    EncodedTags tags;
    std::optional<RequestContext> context;
};

/**
 * @class IBackend
 * @brief Native transmission layer (connection, batching, flushing)
 *
 * Metric and submit calls return false when the backend dropped the data.
 * Implementations may also throw std::exception; callers absorb both.
 */
class IBackend {
public:
    virtual ~IBackend() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool loaded() const = 0;

    virtual bool setGauge(const std::string& key, double value, const EncodedTags& tags) = 0;
    virtual bool incrementCounter(const std::string& key, double amount, const EncodedTags& tags) = 0;
    virtual bool addDistributionValue(const std::string& key, double value, const EncodedTags& tags) = 0;

    virtual bool submitError(const ErrorSubmission& submission) = 0;

    virtual const char* name() const = 0;
};

} // namespace Beacon
