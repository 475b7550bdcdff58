#include "cairn/metadata/metadata.hpp"

#include <cmath>

namespace cairn::metadata {

auto type_of(const MetadataValue& v) noexcept -> ValueType {
    switch (v.index()) {
        case 0: return ValueType::string;
        case 1: return ValueType::number;
        case 2: return ValueType::integer;
        default: return ValueType::boolean;
    }
}

auto conforms(const MetadataValue& v, ValueType t) noexcept -> bool {
    const auto actual = type_of(v);
    if (actual == t) return true;
    // integers are numbers
    return t == ValueType::number && actual == ValueType::integer;
}

auto type_name(ValueType t) noexcept -> std::string_view {
    switch (t) {
        case ValueType::string: return "string";
        case ValueType::number: return "number";
        case ValueType::integer: return "integer";
        case ValueType::boolean: return "boolean";
    }
    return "string";
}

auto parse_type(std::string_view s) noexcept -> std::optional<ValueType> {
    if (s == "string") return ValueType::string;
    if (s == "number") return ValueType::number;
    if (s == "integer") return ValueType::integer;
    if (s == "boolean") return ValueType::boolean;
    return std::nullopt;
}

auto validate(const Metadata& md, const MetadataSchema& schema)
    -> std::expected<void, core::error> {
    using core::error; using core::error_code;
    for (const auto& [key, value] : md) {
        if (key.empty()) {
            return std::unexpected(error{error_code::invalid_argument,
                                         "metadata key must be non-empty", "metadata.validate"});
        }
        if (const auto* d = std::get_if<double>(&value); d && !std::isfinite(*d)) {
            return std::unexpected(error{error_code::invalid_argument,
                                         "metadata value for '" + key + "' is not finite",
                                         "metadata.validate"});
        }
        auto it = schema.fields.find(key);
        if (it == schema.fields.end()) {
            if (schema.strict) {
                return std::unexpected(error{error_code::invalid_argument,
                                             "undeclared metadata key '" + key + "'",
                                             "metadata.validate"});
            }
            continue;
        }
        if (!conforms(value, it->second.type)) {
            return std::unexpected(error{error_code::invalid_argument,
                                         "metadata key '" + key + "' expects " +
                                             std::string(type_name(it->second.type)) + ", got " +
                                             std::string(type_name(type_of(value))),
                                         "metadata.validate"});
        }
    }
    for (const auto& [key, spec] : schema.fields) {
        if (spec.required && md.find(key) == md.end()) {
            return std::unexpected(error{error_code::invalid_argument,
                                         "missing required metadata key '" + key + "'",
                                         "metadata.validate"});
        }
    }
    return {};
}

auto as_number(const MetadataValue& v) noexcept -> std::optional<double> {
    if (const auto* d = std::get_if<double>(&v)) return *d;
    if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
    return std::nullopt;
}

} // namespace cairn::metadata
