/**
 * @file fault_injecting_record_store.hpp
 * @brief Record store wrapper that fails selected calls
 */

#pragma once

#include <migrate/storage/memory_record_store.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace migrate::storage::testing {

/**
 * @brief Delegates to a memory_record_store and injects write failures
 *
 * Upsert calls to the watched table are numbered from 1. The configured
 * call fails without writing anything, every other call is delegated.
 *
 * @example
 * @code
 * auto store = std::make_shared<fault_injecting_record_store>();
 * store->fail_upsert_call("customer_v2", 5);  // 5th batch fails
 * store->fail_scan_after("customer_v1", 1);     // read error after one row
 * @endcode
 */
class fault_injecting_record_store final : public record_store_interface {
public:
    fault_injecting_record_store()
        : inner_(std::make_shared<memory_record_store>()) {}

    [[nodiscard]] auto inner() -> memory_record_store& { return *inner_; }

    [[nodiscard]] auto create_table(const core::table_shape& shape) -> VoidResult {
        return inner_->create_table(shape);
    }

    /// Fail the @p call_number-th upsert to @p table (1-based)
    void fail_upsert_call(std::string table, std::size_t call_number) {
        std::lock_guard<std::mutex> lock(mutex_);
        watched_table_ = std::move(table);
        failing_call_ = call_number;
        upsert_calls_ = 0;
    }

    /// Fail every remove() on @p table
    void fail_removes(std::string table) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_remove_table_ = std::move(table);
    }

    /// Cursors over @p table end with a read error after @p rows rows
    void fail_scan_after(std::string table, std::size_t rows) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_scan_table_ = std::move(table);
        scan_rows_before_failure_ = rows;
    }

    /// Fail every upsert and remove, across tables
    void fail_all_writes(bool fail) { fail_all_writes_ = fail; }

    [[nodiscard]] auto upsert_calls() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return upsert_calls_;
    }

    // =========================================================================
    // record_store_interface
    // =========================================================================

    [[nodiscard]] auto describe(std::string_view table) const
        -> Result<core::table_shape> override {
        return inner_->describe(table);
    }

    [[nodiscard]] auto get(std::string_view table, const core::row_key& key) const
        -> Result<core::row> override {
        return inner_->get(table, key);
    }

    [[nodiscard]] auto contains(std::string_view table,
                                const core::row_key& key) const -> bool override {
        return inner_->contains(table, key);
    }

    [[nodiscard]] auto find(std::string_view table, const core::row_filter& filter) const
        -> Result<std::unique_ptr<row_cursor>> override {
        auto cursor = inner_->find(table, filter);
        if (cursor.is_err()) {
            return cursor;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!failing_scan_table_ || *failing_scan_table_ != table) {
            return cursor;
        }
        return Result<std::unique_ptr<row_cursor>>(std::make_unique<truncated_cursor>(
            std::move(cursor.value()), scan_rows_before_failure_));
    }

    [[nodiscard]] auto upsert(std::string_view table, const std::vector<core::row>& rows)
        -> VoidResult override {
        if (fail_all_writes_) {
            return injected("upsert");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (watched_table_ && *watched_table_ == table &&
                ++upsert_calls_ == failing_call_) {
                return injected("upsert");
            }
        }
        return inner_->upsert(table, rows);
    }

    [[nodiscard]] auto remove(std::string_view table, const core::row_key& key)
        -> VoidResult override {
        if (fail_all_writes_) {
            return injected("remove");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failing_remove_table_ && *failing_remove_table_ == table) {
                return injected("remove");
            }
        }
        return inner_->remove(table, key);
    }

private:
    /// Yields a limited number of rows, then reports a read failure
    class truncated_cursor final : public row_cursor {
    public:
        truncated_cursor(std::unique_ptr<row_cursor> inner, std::size_t limit)
            : inner_(std::move(inner)), remaining_(limit) {}

        [[nodiscard]] auto next() -> std::optional<core::row> override {
            if (remaining_ == 0) {
                failure_ = error_info{error_codes::store_error, "disk I/O error",
                                      "fault_injection"};
                return std::nullopt;
            }
            --remaining_;
            return inner_->next();
        }

        [[nodiscard]] auto failure() const -> std::optional<error_info> override {
            return failure_;
        }

    private:
        std::unique_ptr<row_cursor> inner_;
        std::size_t remaining_;
        std::optional<error_info> failure_;
    };

    [[nodiscard]] static auto injected(const char* operation) -> VoidResult {
        return migrate_void_error(error_codes::store_error,
                                  std::string("injected ") + operation + " failure",
                                  "fault_injection");
    }

    std::shared_ptr<memory_record_store> inner_;

    mutable std::mutex mutex_;
    std::optional<std::string> watched_table_;
    std::size_t failing_call_{0};
    std::size_t upsert_calls_{0};
    std::optional<std::string> failing_remove_table_;
    std::optional<std::string> failing_scan_table_;
    std::size_t scan_rows_before_failure_{0};
    std::atomic<bool> fail_all_writes_{false};
};

}  // namespace migrate::storage::testing
