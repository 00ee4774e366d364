#include <beacon/core/encoding/scalar_value.hpp>
#include <spdlog/fmt/fmt.h>

namespace Beacon {

std::string ScalarValue::toString() const {
    struct Visitor {
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const { return fmt::format("{}", v); }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
    };
    return std::visit(Visitor{}, value_);
}

} // namespace Beacon
