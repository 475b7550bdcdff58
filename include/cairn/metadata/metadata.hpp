#pragma once

/** \file metadata.hpp
 *  \brief Record metadata values and optional per-collection metadata schema.
 */

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "cairn/error.hpp"

namespace cairn::metadata {

/** \brief Metadata value type (tagged union of primitives). */
using MetadataValue = std::variant<std::string, double, std::int64_t, bool>;

/** \brief Key/value metadata attached to a record. Ordered for deterministic output. */
using Metadata = std::map<std::string, MetadataValue>;

/** \brief Declared type of a schema field. `number` accepts double and int64. */
enum class ValueType : std::uint8_t { string = 0, number = 1, integer = 2, boolean = 3 };

/** \brief One declared field. */
struct FieldSpec {
    ValueType type{ValueType::string};
    bool required{false};
};

/** \brief Optional metadata schema of a collection.
 *
 * An empty schema accepts any metadata. When `strict` is set, keys that are not
 * declared in `fields` are rejected.
 */
struct MetadataSchema {
    std::map<std::string, FieldSpec> fields;
    bool strict{false};

    [[nodiscard]] auto empty() const noexcept -> bool { return fields.empty() && !strict; }
};

/** \brief Type tag of a stored value. */
auto type_of(const MetadataValue& v) noexcept -> ValueType;

/** \brief Whether `v` satisfies a field declared as `t`. */
auto conforms(const MetadataValue& v, ValueType t) noexcept -> bool;

auto type_name(ValueType t) noexcept -> std::string_view;
auto parse_type(std::string_view s) noexcept -> std::optional<ValueType>;

/** \brief Validate metadata against a schema.
 *
 * Checks: keys are non-empty; declared fields have the declared type; required
 * fields are present; under `strict`, no undeclared keys; doubles are finite.
 * \return invalid_argument naming the offending key
 */
auto validate(const Metadata& md, const MetadataSchema& schema)
    -> std::expected<void, core::error>;

/** \brief Numeric view of a value (double or int64), nullopt otherwise. */
auto as_number(const MetadataValue& v) noexcept -> std::optional<double>;

} // namespace cairn::metadata
