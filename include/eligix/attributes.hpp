#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace eligix {

    /**
     * @brief Value of a single feature attribute
     *
     * std::monostate stands for a null (missing) value inside an otherwise
     * present attribute.
     */
    using AttributeValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    /// Attribute record of one feature, keyed by attribute name
    using AttributeRecord = std::unordered_map<std::string, AttributeValue>;

    inline bool is_numeric(const AttributeValue &value) {
        return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
    }

    /// Numeric value as double; only meaningful when is_numeric(value)
    inline double as_double(const AttributeValue &value) {
        if (const auto *i = std::get_if<std::int64_t>(&value))
            return static_cast<double>(*i);
        if (const auto *d = std::get_if<double>(&value))
            return *d;
        return 0.0;
    }

    /// Human readable rendering, strings quoted
    std::string to_string(const AttributeValue &value);

    /// Name of the held type ("null", "bool", "int", "double", "string")
    std::string type_name(const AttributeValue &value);

} // namespace eligix
