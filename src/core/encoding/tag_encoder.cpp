#include <beacon/core/encoding/tag_encoder.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace Beacon {

namespace {

const char* FLOAT_TAG = "tag:yaml.org,2002:float";

ScalarValue decodeScalar(const YAML::Node& value) {
    // Quoted scalars carry the non-specific "!" tag
    if (value.Tag() == "!") {
        return ScalarValue(value.Scalar());
    }

    double floating = 0.0;
    if (value.Tag() == FLOAT_TAG) {
        if (!YAML::convert<double>::decode(value, floating)) {
            throw std::runtime_error("Tag value is not a valid float: " + value.Scalar());
        }
        return ScalarValue(floating);
    }

    int64_t integer = 0;
    if (YAML::convert<int64_t>::decode(value, integer)) return ScalarValue(integer);
    if (YAML::convert<double>::decode(value, floating)) return ScalarValue(floating);

    bool flag = false;
    if (YAML::convert<bool>::decode(value, flag)) return ScalarValue(flag);

    return ScalarValue(value.Scalar());
}

} // namespace

EncodedTags TagEncoder::encode(const TagSet& tags) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetDoublePrecision(std::numeric_limits<double>::max_digits10);

    out << YAML::BeginMap;
    for (const auto& [key, value] : tags) {
        out << YAML::Key << key << YAML::Value;

        const auto& storage = value.storage();
        if (const auto* s = std::get_if<std::string>(&storage)) {
            out << *s;
        } else if (const auto* i = std::get_if<int64_t>(&storage)) {
            out << *i;
        } else if (const auto* d = std::get_if<double>(&storage)) {
            out << YAML::SecondaryTag("float") << *d;
        } else {
            out << std::get<bool>(storage);
        }
    }
    out << YAML::EndMap;

    if (!out.good()) {
        throw std::runtime_error("Tag encoding failed: " + out.GetLastError());
    }
    return out.c_str();
}

TagSet TagEncoder::decode(const EncodedTags& payload) {
    YAML::Node root;
    try {
        root = YAML::Load(payload);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Malformed tag payload: ") + e.what());
    }

    if (!root.IsMap()) {
        throw std::runtime_error("Tag payload is not a mapping: " + payload);
    }

    TagSet tags;
    for (const auto& entry : root) {
        const YAML::Node& value = entry.second;
        if (!value.IsScalar()) {
            throw std::runtime_error("Tag value is not a scalar for key: " + entry.first.Scalar());
        }
        tags[entry.first.Scalar()] = decodeScalar(value);
    }
    return tags;
}

} // namespace Beacon
