/**
 * @file field_value.cpp
 * @brief Implementation of field value helpers
 */

#include <migrate/core/field_value.hpp>

#include <migrate/compat/format.hpp>

namespace migrate::core {

auto type_of(const field_value& value) noexcept -> field_type {
    switch (value.index()) {
        case 1:
            return field_type::integer;
        case 2:
            return field_type::real;
        case 3:
            return field_type::boolean;
        case 4:
            return field_type::text;
        default:
            return field_type::null;
    }
}

auto is_lossless_conversion(field_type from, field_type to) noexcept -> bool {
    if (from == to || from == field_type::null) {
        return true;
    }

    switch (from) {
        case field_type::boolean:
            return to == field_type::integer || to == field_type::text;
        case field_type::integer:
        case field_type::real:
            return to == field_type::text;
        default:
            return false;
    }
}

auto convert_value(const field_value& value, field_type target)
    -> Result<field_value> {
    auto source = type_of(value);
    if (source == target || source == field_type::null) {
        return value;
    }

    if (!is_lossless_conversion(source, target)) {
        return migrate_error<field_value>(
            error_codes::type_mismatch,
            compat::format("Cannot convert {} value to {}",
                           to_string(source), to_string(target)),
            "row");
    }

    if (target == field_type::text) {
        return field_value{to_display_string(value)};
    }

    // Only boolean -> integer remains
    return field_value{static_cast<std::int64_t>(std::get<bool>(value) ? 1 : 0)};
}

auto to_display_string(const field_value& value) -> std::string {
    switch (type_of(value)) {
        case field_type::integer:
            return std::to_string(std::get<std::int64_t>(value));
        case field_type::real:
            return compat::format("{}", std::get<double>(value));
        case field_type::boolean:
            return std::get<bool>(value) ? "true" : "false";
        case field_type::text:
            return std::get<std::string>(value);
        case field_type::null:
            break;
    }
    return "";
}

}  // namespace migrate::core
