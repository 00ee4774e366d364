#pragma once
#include <beacon/core/encoding/tag_encoder.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>

namespace Beacon {

enum class Namespace : uint8_t {
    HTTP_REQUEST = 0,   // Triggered while serving a request
    BACKGROUND = 1      // Jobs, timers, crash reports
};

const char* toString(Namespace ns);

/**
 * @class Transaction
 * @brief Submittable error-report record
 *
 * Lives only until it is handed to the backend. The id is never empty.
 */
class Transaction {
public:
    /**
     * @throws std::invalid_argument if id is empty
     */
    Transaction(std::string id, Namespace ns);

    const std::string& id() const { return id_; }
    Namespace getNamespace() const { return namespace_; }

    // Sample data is stored encoded, one payload per key
    void setSampleData(const std::string& key, const TagSet& data);
    const std::map<std::string, EncodedTags>& sampleData() const { return sample_data_; }

private:
    std::string id_;
    Namespace namespace_;
    std::map<std::string, EncodedTags> sample_data_;
};

/**
 * Construction contract for transactions. The agent takes any
 * implementation so hosts with their own tracing layer can supply theirs.
 */
class ITransactionFactory {
public:
    virtual ~ITransactionFactory() = default;

    /**
     * @brief Create a transaction; an empty id is replaced by generateId()
     */
    virtual Transaction create(const std::string& id, Namespace ns) = 0;
    virtual std::string generateId() = 0;
};

/**
 * Random RFC 4122 version 4 identifiers.
 */
class DefaultTransactionFactory : public ITransactionFactory {
public:
    DefaultTransactionFactory();

    Transaction create(const std::string& id, Namespace ns) override;
    std::string generateId() override;

private:
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace Beacon
