/**
 * @file memory_record_store.hpp
 * @brief In-process record store
 *
 * Keeps every table in memory, keyed by row key. Used for tests, dry runs
 * and embedding the engine in tools that stage data before writing it to a
 * durable store.
 */

#pragma once

#include <migrate/storage/record_store.hpp>

#include <map>
#include <shared_mutex>
#include <string>

namespace migrate::storage {

/**
 * @brief Thread-safe in-memory implementation of record_store_interface
 *
 * Rows are validated against the table shape on upsert. find() returns a
 * cursor over a copy of the matching rows, so later writes do not affect an
 * open cursor.
 */
class memory_record_store final : public record_store_interface {
public:
    memory_record_store() = default;
    ~memory_record_store() override = default;

    memory_record_store(const memory_record_store&) = delete;
    auto operator=(const memory_record_store&) -> memory_record_store& = delete;

    /**
     * @brief Create a table
     * @return Error if the shape is invalid or the table already exists
     *         with a different shape
     */
    [[nodiscard]] auto create_table(const core::table_shape& shape) -> VoidResult;

    /**
     * @brief Drop a table and all its rows
     */
    void drop_table(std::string_view table);

    [[nodiscard]] auto describe(std::string_view table) const
        -> Result<core::table_shape> override;

    [[nodiscard]] auto get(std::string_view table, const core::row_key& key) const
        -> Result<core::row> override;

    [[nodiscard]] auto contains(std::string_view table,
                                const core::row_key& key) const -> bool override;

    [[nodiscard]] auto find(std::string_view table,
                            const core::row_filter& filter) const
        -> Result<std::unique_ptr<row_cursor>> override;

    [[nodiscard]] auto upsert(std::string_view table,
                              const std::vector<core::row>& rows)
        -> VoidResult override;

    [[nodiscard]] auto remove(std::string_view table, const core::row_key& key)
        -> VoidResult override;

    /**
     * @brief Copy every row of a table ordered by key
     *
     * Convenience for comparisons in tests and tooling.
     */
    [[nodiscard]] auto dump(std::string_view table) const
        -> Result<std::map<core::row_key, core::row>>;

private:
    struct table_data {
        core::table_shape shape;
        std::map<core::row_key, core::row> rows;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, table_data, std::less<>> tables_;
};

}  // namespace migrate::storage
