/**
 * @file migration_ledger.cpp
 * @brief Implementation of the SQLite migration ledger
 */

#include <migrate/engine/migration_ledger.hpp>

#include <migrate/compat/format.hpp>
#include <migrate/compat/time.hpp>
#include <migrate/storage/sqlite_database.hpp>

#include <sqlite3.h>

#include <mutex>
#include <stdexcept>

namespace migrate::engine {

namespace {

[[nodiscard]] auto column_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

[[nodiscard]] auto parse_tag_row(sqlite3_stmt* stmt) -> migration_tag {
    migration_tag tag;
    tag.id = column_text(stmt, 0);
    tag.scope = migration_scope::from_string(column_text(stmt, 1))
                    .value_or(migration_scope::global());
    tag.applied_at = compat::from_timestamp_string(column_text(stmt, 2));
    return tag;
}

}  // namespace

sqlite_migration_ledger::sqlite_migration_ledger(
    std::shared_ptr<storage::sqlite_database> db)
    : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("sqlite_migration_ledger requires a database");
    }
}

auto sqlite_migration_ledger::has_tag(std::string_view tag_id,
                                      const migration_scope& scope) const
    -> Result<bool> {
    auto found = find_tag(tag_id, scope);
    if (found.is_ok()) {
        return true;
    }
    if (found.error().code == error_codes::tag_not_found) {
        return false;
    }
    return Result<bool>(found.error());
}

auto sqlite_migration_ledger::commit_tag(std::string_view tag_id,
                                         const migration_scope& scope)
    -> VoidResult {
    if (tag_id.empty()) {
        return migrate_void_error(error_codes::ledger_error,
                                  "Tag id must not be empty", "ledger");
    }

    static constexpr const char* sql =
        "INSERT INTO migration_tags (tag_id, scope, applied_at) VALUES (?, ?, ?);";

    std::lock_guard lock(db_->mutex());

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_void_error(
            error_codes::ledger_error,
            compat::format("Failed to prepare commit: {}", db_->last_error()),
            "ledger");
    }

    auto id = std::string(tag_id);
    auto scope_text = scope.to_string();
    auto applied_at = compat::to_timestamp_string(std::chrono::system_clock::now());

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, scope_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, applied_at.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return migrate_void_error(
            error_codes::already_committed,
            compat::format("Tag '{}' already committed for {}", id, scope_text),
            "ledger");
    }
    if (rc != SQLITE_DONE) {
        return migrate_void_error(
            error_codes::ledger_error,
            compat::format("Failed to commit tag '{}': {}", id, db_->last_error()),
            "ledger");
    }

    return ok();
}

auto sqlite_migration_ledger::find_tag(std::string_view tag_id,
                                       const migration_scope& scope) const
    -> Result<migration_tag> {
    static constexpr const char* sql =
        "SELECT tag_id, scope, applied_at FROM migration_tags "
        "WHERE tag_id = ? AND scope = ?;";

    std::lock_guard lock(db_->mutex());

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_error<migration_tag>(
            error_codes::ledger_error,
            compat::format("Failed to prepare lookup: {}", db_->last_error()),
            "ledger");
    }

    auto id = std::string(tag_id);
    auto scope_text = scope.to_string();
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, scope_text.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        auto tag = parse_tag_row(stmt);
        sqlite3_finalize(stmt);
        return tag;
    }
    sqlite3_finalize(stmt);

    if (rc == SQLITE_DONE) {
        return migrate_error<migration_tag>(
            error_codes::tag_not_found,
            compat::format("Tag '{}' not committed for {}", id, scope_text),
            "ledger");
    }
    return migrate_error<migration_tag>(error_codes::ledger_error,
                                        db_->last_error(), "ledger");
}

auto sqlite_migration_ledger::list_tags() const
    -> Result<std::vector<migration_tag>> {
    static constexpr const char* sql =
        "SELECT tag_id, scope, applied_at FROM migration_tags "
        "ORDER BY applied_at, tag_id, scope;";

    std::lock_guard lock(db_->mutex());

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_error<std::vector<migration_tag>>(
            error_codes::ledger_error, db_->last_error(), "ledger");
    }

    std::vector<migration_tag> tags;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        tags.push_back(parse_tag_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return migrate_error<std::vector<migration_tag>>(
            error_codes::ledger_error, db_->last_error(), "ledger");
    }
    return tags;
}

}  // namespace migrate::engine
