/**
 * @file record_store.hpp
 * @brief Abstract record store used by the migration engine
 *
 * This file defines the record_store_interface class, the only way the
 * engine reads and writes tabular records. Concrete implementations
 * (memory_record_store, sqlite_record_store, or an adapter to a remote
 * store) must inherit from this interface.
 */

#pragma once

#include <migrate/core/row.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::storage {

/// Result type alias for operations returning a value
template <typename T>
using Result = migrate::Result<T>;

/// Result type alias for void operations
using VoidResult = migrate::VoidResult;

/**
 * @brief Forward-only cursor over rows returned by a find() call
 */
class row_cursor {
public:
    virtual ~row_cursor() = default;

    /**
     * @brief Fetch the next row
     * @return The next row, or std::nullopt when the cursor is exhausted
     */
    [[nodiscard]] virtual auto next() -> std::optional<core::row> = 0;

    /**
     * @brief Error that ended the scan early, if any
     *
     * A cursor that fails while reading reports exhaustion from next() and
     * the cause here.
     */
    [[nodiscard]] virtual auto failure() const -> std::optional<error_info> {
        return std::nullopt;
    }
};

/**
 * @brief Cursor over a materialized vector of rows
 */
class vector_row_cursor final : public row_cursor {
public:
    explicit vector_row_cursor(std::vector<core::row> rows)
        : rows_(std::move(rows)) {}

    [[nodiscard]] auto next() -> std::optional<core::row> override {
        if (position_ >= rows_.size()) {
            return std::nullopt;
        }
        return std::move(rows_[position_++]);
    }

private:
    std::vector<core::row> rows_;
    std::size_t position_{0};
};

/**
 * @brief Abstract tabular record store
 *
 * The engine never assumes a query language: filters are opaque predicates
 * passed through unmodified.
 *
 * Thread Safety:
 * - All methods must be thread-safe in concrete implementations
 * - upsert() must be atomic per call (all rows of the batch or none)
 *
 * @example
 * @code
 * memory_record_store store;
 * store.create_table(customer_shape);
 *
 * auto write = store.upsert("customer", {alice, bob});
 * auto cursor = store.find("customer", [](const core::row& r) {
 *     return r.get("grade") == core::field_value{std::string{"A"}};
 * });
 * @endcode
 */
class record_store_interface {
public:
    virtual ~record_store_interface() = default;

    // =========================================================================
    // Schema
    // =========================================================================

    /**
     * @brief Get the shape of a table
     * @return The shape, or table_not_found error
     */
    [[nodiscard]] virtual auto describe(std::string_view table) const
        -> Result<core::table_shape> = 0;

    /**
     * @brief Check if a table exists
     */
    [[nodiscard]] virtual auto has_table(std::string_view table) const -> bool {
        return describe(table).is_ok();
    }

    // =========================================================================
    // Record Operations
    // =========================================================================

    /**
     * @brief Get a row by key
     * @return The row, record_not_found or table_not_found error
     */
    [[nodiscard]] virtual auto get(std::string_view table,
                                   const core::row_key& key) const
        -> Result<core::row> = 0;

    /**
     * @brief Check if a row exists
     */
    [[nodiscard]] virtual auto contains(std::string_view table,
                                        const core::row_key& key) const
        -> bool = 0;

    /**
     * @brief Open a cursor over rows matching a filter
     *
     * @param table Table to scan
     * @param filter Opaque predicate; empty matches every row
     * @return Cursor or table_not_found error
     */
    [[nodiscard]] virtual auto find(std::string_view table,
                                    const core::row_filter& filter) const
        -> Result<std::unique_ptr<row_cursor>> = 0;

    /**
     * @brief Insert or replace rows keyed by the table's key field
     *
     * Atomic per call: on error no row of the batch is visible.
     */
    [[nodiscard]] virtual auto upsert(std::string_view table,
                                      const std::vector<core::row>& rows)
        -> VoidResult = 0;

    /**
     * @brief Delete a row by key
     *
     * @note Removing a non-existent row is not an error
     */
    [[nodiscard]] virtual auto remove(std::string_view table,
                                      const core::row_key& key)
        -> VoidResult = 0;

    // =========================================================================
    // Aggregates
    // =========================================================================

    /**
     * @brief Count rows matching a filter
     *
     * Default implementation drains a find() cursor.
     */
    [[nodiscard]] virtual auto count(std::string_view table,
                                     const core::row_filter& filter) const
        -> Result<std::size_t>;
};

}  // namespace migrate::storage
