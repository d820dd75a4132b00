/**
 * @file sqlite_database.cpp
 * @brief Implementation of the shared SQLite connection
 */

#include <migrate/storage/sqlite_database.hpp>

#include <sqlite3.h>

#include <migrate/compat/format.hpp>

namespace migrate::storage {

auto sqlite_database::open(std::string_view db_path, const sqlite_config& config)
    -> Result<std::shared_ptr<sqlite_database>> {
    using result_type = Result<std::shared_ptr<sqlite_database>>;

    sqlite3* db = nullptr;
    auto rc = sqlite3_open_v2(std::string(db_path).c_str(), &db,
                              SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                  SQLITE_OPEN_FULLMUTEX,
                              nullptr);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return migrate_error<std::shared_ptr<sqlite_database>>(
            error_codes::store_error,
            compat::format("Failed to open database '{}': {}", db_path, error_msg),
            "sqlite");
    }

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return migrate_error<std::shared_ptr<sqlite_database>>(
            error_codes::store_error, "Failed to enable foreign keys", "sqlite");
    }

    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return migrate_error<std::shared_ptr<sqlite_database>>(
                error_codes::store_error, "Failed to enable WAL mode", "sqlite");
        }
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    auto instance = std::shared_ptr<sqlite_database>(
        new sqlite_database(db, std::string(db_path)));

    auto migration_result = instance->migrator_.run_migrations(db);
    if (migration_result.is_err()) {
        return result_type(error_info{
            migration_result.error().code,
            compat::format("Schema setup failed: {}",
                           migration_result.error().message),
            "sqlite"});
    }

    return result_type(std::move(instance));
}

sqlite_database::sqlite_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

sqlite_database::~sqlite_database() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_database::execute(std::string_view sql) -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, std::string(sql).c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);
        return migrate_void_error(
            error_codes::store_error,
            compat::format("SQL execution failed: {}", error_str), "sqlite");
    }

    return ok();
}

auto sqlite_database::begin_transaction() -> VoidResult {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

auto sqlite_database::commit() -> VoidResult {
    return execute("COMMIT;");
}

auto sqlite_database::rollback() -> VoidResult {
    return execute("ROLLBACK;");
}

auto sqlite_database::schema_version() const -> int {
    return migrator_.get_current_version(db_);
}

auto sqlite_database::last_error() const -> std::string {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

}  // namespace migrate::storage
