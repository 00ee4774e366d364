#include <beacon/core/transaction/transaction.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace Beacon {

const char* toString(Namespace ns) {
    switch (ns) {
        case Namespace::HTTP_REQUEST: return "http_request";
        case Namespace::BACKGROUND:   return "background";
        default:                      return "unknown";
    }
}

Transaction::Transaction(std::string id, Namespace ns)
    : id_(std::move(id)), namespace_(ns) {
    if (id_.empty()) {
        throw std::invalid_argument("Transaction id must not be empty");
    }
}

void Transaction::setSampleData(const std::string& key, const TagSet& data) {
    sample_data_[key] = TagEncoder::encode(data);
}

DefaultTransactionFactory::DefaultTransactionFactory()
    : rng_(std::random_device{}()) {}

Transaction DefaultTransactionFactory::create(const std::string& id, Namespace ns) {
    return Transaction(id.empty() ? generateId() : id, ns);
}

std::string DefaultTransactionFactory::generateId() {
    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        high = rng_();
        low = rng_();
    }

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(high >> 32),
                       static_cast<uint32_t>((high >> 16) & 0xFFFF),
                       static_cast<uint32_t>(high & 0xFFFF),
                       static_cast<uint32_t>(low >> 48),
                       low & 0xFFFFFFFFFFFFULL);
}

} // namespace Beacon
