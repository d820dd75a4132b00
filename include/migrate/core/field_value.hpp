/**
 * @file field_value.hpp
 * @brief Typed field values for the generic row abstraction
 *
 * This file defines the field_type enumeration and the field_value variant
 * used by rows, mappings and validation rules, together with the
 * conversion rules the mapping compiler relies on.
 */

#pragma once

#include <migrate/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace migrate::core {

/**
 * @brief Storage type of a field
 */
enum class field_type {
    null,
    integer,
    real,
    boolean,
    text
};

/**
 * @brief Convert field_type to string representation
 * @param type The field type
 * @return String representation ("null", "integer", "real", "boolean", "text")
 */
[[nodiscard]] constexpr auto to_string(field_type type) noexcept
    -> std::string_view {
    switch (type) {
        case field_type::null:
            return "null";
        case field_type::integer:
            return "integer";
        case field_type::real:
            return "real";
        case field_type::boolean:
            return "boolean";
        case field_type::text:
            return "text";
    }
    return "unknown";
}

/**
 * @brief Parse field_type from string
 * @param str String representation
 * @return Parsed field type or std::nullopt if invalid
 */
[[nodiscard]] constexpr auto field_type_from_string(std::string_view str)
    -> std::optional<field_type> {
    if (str == "null") {
        return field_type::null;
    }
    if (str == "integer") {
        return field_type::integer;
    }
    if (str == "real") {
        return field_type::real;
    }
    if (str == "boolean") {
        return field_type::boolean;
    }
    if (str == "text") {
        return field_type::text;
    }
    return std::nullopt;
}

/**
 * @brief A single field value
 *
 * Alternatives are ordered to match field_type: std::monostate is the SQL
 * style NULL.
 *
 * @note Build text values from std::string explicitly; a bare string
 *       literal must not be allowed to select the bool alternative.
 */
using field_value =
    std::variant<std::monostate, std::int64_t, double, bool, std::string>;

/**
 * @brief Get the field_type of a value
 */
[[nodiscard]] auto type_of(const field_value& value) noexcept -> field_type;

/**
 * @brief Check if a value is NULL
 */
[[nodiscard]] inline auto is_null(const field_value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Check whether values of @p from can be stored in @p to without loss
 *
 * Identical types are always compatible. The accepted widenings are
 * boolean->integer, boolean->text, integer->text and real->text. NULL is
 * compatible with every type; nullability is checked separately.
 */
[[nodiscard]] auto is_lossless_conversion(field_type from,
                                          field_type to) noexcept -> bool;

/**
 * @brief Convert a value to the target type
 *
 * Only conversions accepted by is_lossless_conversion() succeed; NULL is
 * returned unchanged.
 *
 * @return Converted value or type_mismatch error
 */
[[nodiscard]] auto convert_value(const field_value& value, field_type target)
    -> Result<field_value>;

/**
 * @brief Render a value for keys, logs and diagnostics
 *
 * NULL renders as an empty string, booleans as "true"/"false" and reals in
 * their shortest round-trip form.
 */
[[nodiscard]] auto to_display_string(const field_value& value) -> std::string;

}  // namespace migrate::core
