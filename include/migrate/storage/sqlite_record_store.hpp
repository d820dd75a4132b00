/**
 * @file sqlite_record_store.hpp
 * @brief SQLite-backed record store
 *
 * Each table shape becomes a SQLite table with one column per declared
 * field plus a hidden `_row_key` primary key holding the row key text.
 * Shapes are recorded in the store catalog so describe() survives restarts.
 */

#pragma once

#include <migrate/storage/record_store.hpp>
#include <migrate/storage/sqlite_database.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace migrate::storage {

/**
 * @brief Durable implementation of record_store_interface on SQLite
 *
 * upsert() runs inside one transaction, so a failed batch leaves no row
 * behind. find() returns a cursor that pages through the table by key,
 * evaluating the filter in process.
 */
class sqlite_record_store final : public record_store_interface {
public:
    /// Rows fetched per page by find() cursors
    static constexpr std::size_t default_page_size = 256;

    explicit sqlite_record_store(std::shared_ptr<sqlite_database> db,
                                 std::size_t page_size = default_page_size);
    ~sqlite_record_store() override = default;

    sqlite_record_store(const sqlite_record_store&) = delete;
    auto operator=(const sqlite_record_store&) -> sqlite_record_store& = delete;

    /**
     * @brief Create a table (no-op when it exists with the same shape)
     */
    [[nodiscard]] auto create_table(const core::table_shape& shape) -> VoidResult;

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
     * @brief Fetch one page of rows with keys greater than @p after_key
     *
     * Used by the paging cursor; exposed for tooling that exports tables.
     */
    [[nodiscard]] auto fetch_page(const core::table_shape& shape,
                                  const std::optional<core::row_key>& after_key,
                                  std::size_t limit) const
        -> Result<std::vector<std::pair<core::row_key, core::row>>>;

private:
    [[nodiscard]] auto load_shape(std::string_view table) const
        -> Result<core::table_shape>;

    std::shared_ptr<sqlite_database> db_;
    std::size_t page_size_;

    mutable std::mutex shape_mutex_;
    mutable std::map<std::string, core::table_shape, std::less<>> shape_cache_;
};

}  // namespace migrate::storage
