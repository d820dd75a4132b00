/**
 * @file row.cpp
 * @brief Implementation of the row abstraction and row codec
 */

#include <migrate/core/row.hpp>

#include <migrate/compat/format.hpp>

#include <charconv>
#include <set>

namespace migrate::core {

// ============================================================================
// table_shape
// ============================================================================

auto table_shape::find_field(std::string_view field_name) const
    -> const field_definition* {
    for (const auto& field : fields) {
        if (field.name == field_name) {
            return &field;
        }
    }
    return nullptr;
}

auto table_shape::validate() const -> VoidResult {
    if (name.empty()) {
        return migrate_void_error(error_codes::plan_invalid,
                                  "Table shape has no name", "row");
    }

    std::set<std::string_view> seen;
    for (const auto& field : fields) {
        if (field.name.empty()) {
            return migrate_void_error(
                error_codes::plan_invalid,
                compat::format("Table '{}' declares a field without a name", name),
                "row");
        }
        if (!seen.insert(field.name).second) {
            return migrate_void_error(
                error_codes::plan_invalid,
                compat::format("Table '{}' declares field '{}' twice", name,
                               field.name),
                "row");
        }
    }

    const auto* key = find_field(key_field);
    if (key == nullptr) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Key field '{}' is not declared in table '{}'",
                           key_field, name),
            "row");
    }
    if (key->nullable) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Key field '{}' of table '{}' must not be nullable",
                           key_field, name),
            "row");
    }

    return ok();
}

// ============================================================================
// row
// ============================================================================

row::row(std::initializer_list<container_type::value_type> fields)
    : fields_(fields) {}

auto row::get(std::string_view field_name) const -> std::optional<field_value> {
    auto it = fields_.find(field_name);
    if (it == fields_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void row::set(std::string_view field_name, field_value value) {
    fields_.insert_or_assign(std::string(field_name), std::move(value));
}

auto row::erase(std::string_view field_name) -> bool {
    auto it = fields_.find(field_name);
    if (it == fields_.end()) {
        return false;
    }
    fields_.erase(it);
    return true;
}

auto row::contains(std::string_view field_name) const -> bool {
    return fields_.find(field_name) != fields_.end();
}

auto row::key(const table_shape& shape) const -> Result<row_key> {
    auto it = fields_.find(shape.key_field);
    if (it == fields_.end() || is_null(it->second)) {
        return migrate_error<row_key>(
            error_codes::record_not_found,
            compat::format("Row has no value for key field '{}' of table '{}'",
                           shape.key_field, shape.name),
            "row");
    }
    return to_display_string(it->second);
}

auto conforms_to(const row& r, const table_shape& shape) -> VoidResult {
    for (const auto& [name, value] : r.fields()) {
        const auto* field = shape.find_field(name);
        if (field == nullptr) {
            return migrate_void_error(
                error_codes::type_mismatch,
                compat::format("Field '{}' is not declared in table '{}'", name,
                               shape.name),
                "row");
        }
        if (is_null(value)) {
            if (!field->nullable) {
                return migrate_void_error(
                    error_codes::type_mismatch,
                    compat::format("Field '{}' of table '{}' must not be NULL",
                                   name, shape.name),
                    "row");
            }
            continue;
        }
        if (type_of(value) != field->type) {
            return migrate_void_error(
                error_codes::type_mismatch,
                compat::format("Field '{}' of table '{}' expects {} but got {}",
                               name, shape.name, to_string(field->type),
                               to_string(type_of(value))),
                "row");
        }
    }

    for (const auto& field : shape.fields) {
        if (!field.nullable && !r.contains(field.name)) {
            return migrate_void_error(
                error_codes::type_mismatch,
                compat::format("Required field '{}' of table '{}' is missing",
                               field.name, shape.name),
                "row");
        }
    }

    return ok();
}

// ============================================================================
// Row codec
// ============================================================================

namespace {

void append_chunk(std::string& out, std::string_view chunk) {
    out += std::to_string(chunk.size());
    out += ':';
    out += chunk;
}

[[nodiscard]] auto type_tag(field_type type) -> char {
    switch (type) {
        case field_type::integer:
            return 'i';
        case field_type::real:
            return 'r';
        case field_type::boolean:
            return 'b';
        case field_type::text:
            return 't';
        case field_type::null:
            break;
    }
    return 'n';
}

/// Cursor over an encoded row
class chunk_reader {
public:
    explicit chunk_reader(std::string_view data) : data_(data) {}

    [[nodiscard]] auto at_end() const noexcept -> bool { return pos_ >= data_.size(); }

    [[nodiscard]] auto read_chunk() -> std::optional<std::string_view> {
        auto colon = data_.find(':', pos_);
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }
        std::size_t length = 0;
        auto [ptr, ec] = std::from_chars(data_.data() + pos_,
                                         data_.data() + colon, length);
        if (ec != std::errc{} || ptr != data_.data() + colon) {
            return std::nullopt;
        }
        auto start = colon + 1;
        if (start + length > data_.size()) {
            return std::nullopt;
        }
        pos_ = start + length;
        return data_.substr(start, length);
    }

    [[nodiscard]] auto read_tag() -> std::optional<char> {
        if (at_end()) {
            return std::nullopt;
        }
        return data_[pos_++];
    }

private:
    std::string_view data_;
    std::size_t pos_{0};
};

[[nodiscard]] auto decode_value(char tag, std::string_view text)
    -> std::optional<field_value> {
    switch (tag) {
        case 'n':
            return field_value{};
        case 't':
            return field_value{std::string(text)};
        case 'b':
            if (text == "true") {
                return field_value{true};
            }
            if (text == "false") {
                return field_value{false};
            }
            return std::nullopt;
        case 'i': {
            std::int64_t value = 0;
            auto [ptr, ec] =
                std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                return std::nullopt;
            }
            return field_value{value};
        }
        case 'r': {
            double value = 0.0;
            auto [ptr, ec] =
                std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                return std::nullopt;
            }
            return field_value{value};
        }
        default:
            return std::nullopt;
    }
}

}  // namespace

auto encode_row(const row& r) -> std::string {
    std::string out;
    for (const auto& [name, value] : r.fields()) {
        append_chunk(out, name);
        out += type_tag(type_of(value));
        append_chunk(out, to_display_string(value));
    }
    return out;
}

auto decode_row(std::string_view encoded) -> Result<row> {
    row result;
    chunk_reader reader(encoded);

    while (!reader.at_end()) {
        auto name = reader.read_chunk();
        auto tag = reader.read_tag();
        auto text = name && tag ? reader.read_chunk() : std::nullopt;
        if (!text) {
            return migrate_error<row>(error_codes::codec_error,
                                      "Truncated or malformed row encoding",
                                      "row");
        }

        auto value = decode_value(*tag, *text);
        if (!value) {
            return migrate_error<row>(
                error_codes::codec_error,
                compat::format("Invalid encoded value for field '{}'", *name),
                "row");
        }
        result.set(*name, std::move(*value));
    }

    return result;
}

}  // namespace migrate::core
