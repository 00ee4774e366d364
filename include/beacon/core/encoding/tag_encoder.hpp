#pragma once
#include <beacon/core/encoding/scalar_value.hpp>
#include <string>

namespace Beacon {

// Encoded tag payload handed to the backend, e.g. {"env": "prod", "n": 3}
using EncodedTags = std::string;

/**
 * @class TagEncoder
 * @brief Stateless tag set <-> backend payload conversion
 *
 * The payload is a flow-style YAML mapping emitted by yaml-cpp, keys in
 * sorted order, so two tag sets with the same entries always encode to the
 * same bytes. Strings are double quoted. Doubles carry the !!float tag and
 * enough digits to read back bit-exact.
 */
class TagEncoder {
public:
    static EncodedTags encode(const TagSet& tags);

    /**
     * @brief Parse a payload produced by encode()
     * @throws std::runtime_error if the payload is not a flat mapping
     */
    static TagSet decode(const EncodedTags& payload);
};

} // namespace Beacon
