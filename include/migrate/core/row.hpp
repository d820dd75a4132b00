/**
 * @file row.hpp
 * @brief Generic tabular record abstraction
 *
 * This file provides the row, field_definition and table_shape types that
 * decouple the migration engine from any concrete storage technology, and
 * the row codec used to persist before-images.
 */

#pragma once

#include <migrate/core/field_value.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::core {

/// Identity of a row within its table (the key field rendered as text)
using row_key = std::string;

/**
 * @brief Declaration of one column of a table shape
 */
struct field_definition {
    /// Field identifier, unique within the shape
    std::string name;

    /// Declared storage type
    field_type type{field_type::text};

    /// Whether NULL may be stored
    bool nullable{true};

    [[nodiscard]] auto operator==(const field_definition& other) const
        -> bool = default;
};

/**
 * @brief Column layout of a table
 *
 * The key field identifies rows; upserts replace the row with the same key.
 */
struct table_shape {
    /// Table name
    std::string name;

    /// Name of the field holding the row identity
    std::string key_field;

    /// Declared fields in column order
    std::vector<field_definition> fields;

    /**
     * @brief Look up a field declaration by name
     * @return Pointer to the declaration, or nullptr if absent
     */
    [[nodiscard]] auto find_field(std::string_view field_name) const
        -> const field_definition*;

    [[nodiscard]] auto has_field(std::string_view field_name) const -> bool {
        return find_field(field_name) != nullptr;
    }

    /**
     * @brief Check structural validity
     *
     * A valid shape has a name, unique non-empty field names and a key
     * field that names a non-nullable field.
     */
    [[nodiscard]] auto validate() const -> VoidResult;

    [[nodiscard]] auto operator==(const table_shape& other) const
        -> bool = default;
};

/**
 * @brief A record: named fields with typed values
 *
 * Fields are kept ordered by name so that two rows with the same content
 * compare equal and encode identically.
 */
class row {
public:
    using container_type = std::map<std::string, field_value, std::less<>>;

    row() = default;

    /**
     * @brief Construct from field/value pairs
     */
    row(std::initializer_list<container_type::value_type> fields);

    /**
     * @brief Get a field value
     * @return The value, or std::nullopt when the field is absent
     */
    [[nodiscard]] auto get(std::string_view field_name) const
        -> std::optional<field_value>;

    /**
     * @brief Set (insert or replace) a field value
     */
    void set(std::string_view field_name, field_value value);

    /**
     * @brief Remove a field
     * @return true if the field existed
     */
    auto erase(std::string_view field_name) -> bool;

    [[nodiscard]] auto contains(std::string_view field_name) const -> bool;

    [[nodiscard]] auto fields() const noexcept -> const container_type& {
        return fields_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return fields_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return fields_.empty(); }

    /**
     * @brief Compute the row key for the given shape
     * @return Key text, or record_not_found error if the key field is missing
     *         or NULL
     */
    [[nodiscard]] auto key(const table_shape& shape) const -> Result<row_key>;

    [[nodiscard]] auto operator==(const row& other) const -> bool = default;

private:
    container_type fields_;
};

/**
 * @brief Opaque row predicate passed through to the record store
 *
 * An empty filter matches every row.
 */
using row_filter = std::function<bool(const row&)>;

/**
 * @brief Evaluate a filter against a row (empty filter matches everything)
 */
[[nodiscard]] inline auto matches(const row_filter& filter, const row& r)
    -> bool {
    return !filter || filter(r);
}

/**
 * @brief Check that a row conforms to a shape
 *
 * Every field must be declared, values must have the declared type (NULL
 * only where nullable) and every non-nullable field must be present.
 */
[[nodiscard]] auto conforms_to(const row& r, const table_shape& shape)
    -> VoidResult;

// ============================================================================
// Row codec
// ============================================================================

/**
 * @brief Encode a row into a self-delimiting text form
 *
 * Each field is written as `<len>:<name><tag><len>:<value>` where tag is one
 * of n, i, r, b, t.
 */
[[nodiscard]] auto encode_row(const row& r) -> std::string;

/**
 * @brief Decode a row produced by encode_row()
 * @return Decoded row or codec_error
 */
[[nodiscard]] auto decode_row(std::string_view encoded) -> Result<row>;

}  // namespace migrate::core
