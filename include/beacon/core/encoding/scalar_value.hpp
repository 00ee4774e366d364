#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>

namespace Beacon {

/**
 * @class ScalarValue
 * @brief Tag / sample value: string, integer, floating point or bool
 *
 * Integral arguments always land in the int64 alternative and floating
 * arguments in the double alternative, so {"n", 3} never becomes a bool.
 */
class ScalarValue {
public:
    using Storage = std::variant<std::string, int64_t, double, bool>;

    ScalarValue() : value_(std::string()) {}
    ScalarValue(const char* value) : value_(std::string(value ? value : "")) {}
    ScalarValue(std::string value) : value_(std::move(value)) {}
    ScalarValue(bool value) : value_(value) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
    ScalarValue(T value) : value_(static_cast<int64_t>(value)) {}

    template <typename T,
              typename std::enable_if<std::is_floating_point<T>::value, int>::type = 0>
    ScalarValue(T value) : value_(static_cast<double>(value)) {}

    bool isString() const { return std::holds_alternative<std::string>(value_); }
    bool isInteger() const { return std::holds_alternative<int64_t>(value_); }
    bool isDouble() const { return std::holds_alternative<double>(value_); }
    bool isBool() const { return std::holds_alternative<bool>(value_); }

    const Storage& storage() const { return value_; }

    /**
     * @brief Human readable form ("prod", "3", "2.5", "true")
     */
    std::string toString() const;

    bool operator==(const ScalarValue& other) const { return value_ == other.value_; }
    bool operator!=(const ScalarValue& other) const { return !(*this == other); }

private:
    Storage value_;
};

// Keys are unique; std::map keeps iteration order canonical
using TagSet = std::map<std::string, ScalarValue>;

} // namespace Beacon
