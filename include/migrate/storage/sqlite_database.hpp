/**
 * @file sqlite_database.hpp
 * @brief Shared SQLite connection for the engine's durable state
 *
 * The ledger, the snapshot store and the SQLite record store can share one
 * connection. The connection owns the schema (see schema_migrator) and a
 * mutex that serializes multi-statement transactions.
 */

#pragma once

#include <migrate/core/result.hpp>
#include <migrate/storage/schema_migrator.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

struct sqlite3;

namespace migrate::storage {

/**
 * @brief Connection options
 */
struct sqlite_config {
    /// Enable WAL journal mode (ignored for ":memory:")
    bool wal_mode{true};

    /// Milliseconds to wait on a locked database before failing
    int busy_timeout_ms{5000};
};

/**
 * @brief RAII owner of a SQLite connection with the engine schema applied
 *
 * Thread Safety: the connection is opened in serialized mode; callers that
 * run several statements as a unit lock mutex() for the duration.
 */
class sqlite_database {
public:
    /**
     * @brief Open (or create) a database and bring its schema up to date
     *
     * @param db_path File path, or ":memory:" for a private in-memory database
     * @param config Connection options
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const sqlite_config& config = {})
        -> Result<std::shared_ptr<sqlite_database>>;

    ~sqlite_database();

    sqlite_database(const sqlite_database&) = delete;
    auto operator=(const sqlite_database&) -> sqlite_database& = delete;
    sqlite_database(sqlite_database&&) = delete;
    auto operator=(sqlite_database&&) -> sqlite_database& = delete;

    [[nodiscard]] auto handle() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto path() const noexcept -> const std::string& {
        return path_;
    }

    /**
     * @brief Mutex guarding multi-statement units of work
     */
    [[nodiscard]] auto mutex() const noexcept -> std::recursive_mutex& {
        return mutex_;
    }

    /**
     * @brief Execute one or more SQL statements without results
     */
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

    [[nodiscard]] auto begin_transaction() -> VoidResult;
    [[nodiscard]] auto commit() -> VoidResult;
    [[nodiscard]] auto rollback() -> VoidResult;

    /**
     * @brief Current engine schema version
     */
    [[nodiscard]] auto schema_version() const -> int;

    /**
     * @brief Last error message reported by SQLite
     */
    [[nodiscard]] auto last_error() const -> std::string;

private:
    sqlite_database(sqlite3* db, std::string path);

    sqlite3* db_{nullptr};
    std::string path_;
    schema_migrator migrator_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace migrate::storage
