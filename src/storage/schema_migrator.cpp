/**
 * @file schema_migrator.cpp
 * @brief Implementation of the engine schema migrator
 */

#include <migrate/storage/schema_migrator.hpp>

#include <sqlite3.h>

#include <migrate/compat/format.hpp>

namespace migrate::storage {

// ============================================================================
// Construction
// ============================================================================

schema_migrator::schema_migrator() {
    steps_.push_back({1, "Create migration ledger",
                      [this](sqlite3* db) { return create_ledger_tables(db); }});
    steps_.push_back({2, "Create rollback snapshot store",
                      [this](sqlite3* db) { return create_snapshot_tables(db); }});
    steps_.push_back({3, "Create record store catalog",
                      [this](sqlite3* db) { return create_store_catalog(db); }});
}

// ============================================================================
// Schema Operations
// ============================================================================

auto schema_migrator::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, LATEST_VERSION);
}

auto schema_migrator::run_migrations_to(sqlite3* db, int target_version)
    -> VoidResult {
    if (target_version > LATEST_VERSION) {
        return migrate_void_error(
            error_codes::store_error,
            compat::format("Target schema version {} exceeds latest version {}",
                           target_version, LATEST_VERSION),
            "schema");
    }

    auto ensure_result = ensure_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);

    while (current_version < target_version) {
        auto next_version = current_version + 1;

        auto begin_result = execute_sql(db, "BEGIN IMMEDIATE TRANSACTION;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        auto step_result = apply_step(db, next_version);
        if (step_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return step_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }

        current_version = next_version;
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto schema_migrator::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' "
        "AND name='engine_schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return 0;
    }

    const char* version_sql = "SELECT MAX(version) FROM engine_schema_version;";
    rc = sqlite3_prepare_v2(db, version_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // sqlite3_column_int returns 0 for NULL
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto schema_migrator::get_latest_version() const noexcept -> int {
    return LATEST_VERSION;
}

auto schema_migrator::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < LATEST_VERSION;
}

auto schema_migrator::get_history(sqlite3* db) const
    -> std::vector<schema_version_record> {
    std::vector<schema_version_record> history;

    const char* sql =
        "SELECT version, description, applied_at FROM engine_schema_version "
        "ORDER BY version;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        schema_version_record record;
        record.version = sqlite3_column_int(stmt, 0);

        const auto* desc = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.description = desc ? desc : "";

        const auto* applied = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.applied_at = applied ? applied : "";

        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto schema_migrator::ensure_version_table(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS engine_schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )";

    return execute_sql(db, sql);
}

auto schema_migrator::apply_step(sqlite3* db, int version) -> VoidResult {
    for (const auto& step : steps_) {
        if (step.version == version) {
            auto result = step.apply(db);
            if (result.is_err()) {
                return result;
            }
            return record_step(db, version, step.description);
        }
    }

    return migrate_void_error(
        error_codes::store_error,
        compat::format("Schema step for version {} not found", version),
        "schema");
}

auto schema_migrator::record_step(sqlite3* db, int version,
                                  std::string_view description) -> VoidResult {
    const char* sql =
        "INSERT INTO engine_schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_void_error(
            error_codes::store_error,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
            "schema");
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return migrate_void_error(
            error_codes::store_error,
            compat::format("Failed to record schema version: {}",
                           sqlite3_errmsg(db)),
            "schema");
    }

    return ok();
}

auto schema_migrator::execute_sql(sqlite3* db, std::string_view sql)
    -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, std::string(sql).c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);

        return migrate_void_error(
            error_codes::store_error,
            compat::format("SQL execution failed: {}", error_str), "schema");
    }

    return ok();
}

// ============================================================================
// Schema Steps
// ============================================================================

auto schema_migrator::create_ledger_tables(sqlite3* db) -> VoidResult {
    // The primary key is the ledger's check-and-set: a second INSERT of the
    // same (tag_id, scope) fails with SQLITE_CONSTRAINT.
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS migration_tags (
            tag_id      TEXT NOT NULL,
            scope       TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now')),
            PRIMARY KEY (tag_id, scope)
        );

        CREATE INDEX IF NOT EXISTS idx_migration_tags_scope
            ON migration_tags(scope);

        CREATE TRIGGER IF NOT EXISTS trg_migration_tags_immutable
        BEFORE UPDATE ON migration_tags
        BEGIN
            SELECT RAISE(ABORT, 'migration tags are append-only');
        END;
    )";

    return execute_sql(db, sql);
}

auto schema_migrator::create_snapshot_tables(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS rollback_snapshots (
            snapshot_id TEXT PRIMARY KEY,
            phase_id    TEXT NOT NULL,
            scope       TEXT NOT NULL,
            table_name  TEXT NOT NULL,
            state       TEXT NOT NULL DEFAULT 'captured',
            created_at  TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at  TEXT NOT NULL DEFAULT (datetime('now')),
            CHECK (state IN ('captured', 'restored', 'discarded'))
        );

        CREATE INDEX IF NOT EXISTS idx_rollback_snapshots_phase
            ON rollback_snapshots(phase_id, scope, state);

        CREATE TABLE IF NOT EXISTS snapshot_images (
            snapshot_id TEXT NOT NULL REFERENCES rollback_snapshots(snapshot_id)
                        ON DELETE CASCADE,
            sequence    INTEGER NOT NULL,
            row_key     TEXT NOT NULL,
            present     INTEGER NOT NULL,
            image       TEXT,
            PRIMARY KEY (snapshot_id, sequence)
        );
    )";

    return execute_sql(db, sql);
}

auto schema_migrator::create_store_catalog(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS store_tables (
            table_name  TEXT PRIMARY KEY,
            key_field   TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS store_columns (
            table_name  TEXT NOT NULL REFERENCES store_tables(table_name)
                        ON DELETE CASCADE,
            position    INTEGER NOT NULL,
            field_name  TEXT NOT NULL,
            field_type  TEXT NOT NULL,
            nullable    INTEGER NOT NULL,
            PRIMARY KEY (table_name, position)
        );
    )";

    return execute_sql(db, sql);
}

}  // namespace migrate::storage
