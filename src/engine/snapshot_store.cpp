/**
 * @file snapshot_store.cpp
 * @brief Implementation of the SQLite snapshot store
 */

#include <migrate/engine/snapshot_store.hpp>

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

[[nodiscard]] auto snapshot_error(int code, const std::string& message) -> error_info {
    return error_info{code, message, "snapshot_store"};
}

/// Parses columns snapshot_id, phase_id, scope, table_name, state, created_at
[[nodiscard]] auto parse_header(sqlite3_stmt* stmt) -> snapshot_summary {
    snapshot_summary summary;
    summary.snapshot_id = column_text(stmt, 0);
    summary.phase_id = column_text(stmt, 1);
    summary.scope = migration_scope::from_string(column_text(stmt, 2))
                        .value_or(migration_scope::global());
    summary.table = column_text(stmt, 3);
    summary.state = snapshot_state_from_string(column_text(stmt, 4))
                        .value_or(snapshot_state::captured);
    summary.created_at = compat::from_timestamp_string(column_text(stmt, 5));
    return summary;
}

}  // namespace

sqlite_snapshot_store::sqlite_snapshot_store(std::shared_ptr<storage::sqlite_database> db)
    : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("sqlite_snapshot_store requires a database");
    }
}

auto sqlite_snapshot_store::save(const rollback_snapshot& snapshot) -> VoidResult {
    std::lock_guard lock(db_->mutex());

    auto begin = db_->begin_transaction();
    if (begin.is_err()) {
        return VoidResult(snapshot_error(error_codes::snapshot_failed, begin.error().message));
    }

    auto fail = [this](const std::string& what) -> VoidResult {
        auto message = compat::format("{}: {}", what, db_->last_error());
        (void)db_->rollback();
        return VoidResult(snapshot_error(error_codes::snapshot_failed, message));
    };

    auto* db = db_->handle();
    sqlite3_stmt* stmt = nullptr;

    auto rc = sqlite3_prepare_v2(
        db,
        "INSERT INTO rollback_snapshots "
        "(snapshot_id, phase_id, scope, table_name, state, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return fail("Failed to prepare snapshot insert");
    }

    auto scope_text = snapshot.scope.to_string();
    auto state_text = std::string(to_string(snapshot.state));
    auto created = compat::to_timestamp_string(snapshot.created_at);
    if (created.empty()) {
        created = compat::to_timestamp_string(std::chrono::system_clock::now());
    }

    sqlite3_bind_text(stmt, 1, snapshot.snapshot_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, snapshot.phase_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, scope_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, snapshot.table.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, state_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, created.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, created.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(compat::format("Failed to save snapshot '{}'", snapshot.snapshot_id));
    }

    rc = sqlite3_prepare_v2(db,
                            "INSERT INTO snapshot_images "
                            "(snapshot_id, sequence, row_key, present, image) "
                            "VALUES (?, ?, ?, ?, ?);",
                            -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return fail("Failed to prepare image insert");
    }

    for (std::size_t i = 0; i < snapshot.captured.size(); ++i) {
        const auto& entry = snapshot.captured[i];
        sqlite3_bind_text(stmt, 1, snapshot.snapshot_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(i));
        sqlite3_bind_text(stmt, 3, entry.key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 4, entry.before_image ? 1 : 0);
        if (entry.before_image) {
            auto encoded = core::encode_row(*entry.before_image);
            sqlite3_bind_text(stmt, 5, encoded.c_str(),
                              static_cast<int>(encoded.size()), SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, 5);
        }

        rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return fail(compat::format("Failed to save before-image of '{}'", entry.key));
        }
    }
    sqlite3_finalize(stmt);

    auto committed = db_->commit();
    if (committed.is_err()) {
        (void)db_->rollback();
        return VoidResult(
            snapshot_error(error_codes::snapshot_failed, committed.error().message));
    }
    return ok();
}

auto sqlite_snapshot_store::update_state(std::string_view snapshot_id,
                                         snapshot_state state) -> VoidResult {
    std::lock_guard lock(db_->mutex());

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db_->handle(),
        "UPDATE rollback_snapshots SET state = ?, updated_at = ? WHERE snapshot_id = ?;",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return VoidResult(snapshot_error(error_codes::store_error, db_->last_error()));
    }

    auto id = std::string(snapshot_id);
    auto state_text = std::string(to_string(state));
    auto now = compat::to_timestamp_string(std::chrono::system_clock::now());
    sqlite3_bind_text(stmt, 1, state_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return VoidResult(snapshot_error(error_codes::store_error, db_->last_error()));
    }
    if (sqlite3_changes(db_->handle()) == 0) {
        return VoidResult(snapshot_error(
            error_codes::snapshot_not_found,
            compat::format("Snapshot '{}' not found", snapshot_id)));
    }
    return ok();
}

auto sqlite_snapshot_store::load(std::string_view snapshot_id) const
    -> Result<rollback_snapshot> {
    using result_type = Result<rollback_snapshot>;

    std::lock_guard lock(db_->mutex());
    auto* db = db_->handle();
    auto id = std::string(snapshot_id);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db,
        "SELECT snapshot_id, phase_id, scope, table_name, state, created_at "
        "FROM rollback_snapshots WHERE snapshot_id = ?;",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return result_type(snapshot_error(error_codes::store_error, db_->last_error()));
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return result_type(snapshot_error(
                error_codes::snapshot_not_found,
                compat::format("Snapshot '{}' not found", snapshot_id)));
        }
        return result_type(snapshot_error(error_codes::store_error, db_->last_error()));
    }

    auto header = parse_header(stmt);
    sqlite3_finalize(stmt);

    rollback_snapshot snapshot;
    snapshot.snapshot_id = std::move(header.snapshot_id);
    snapshot.phase_id = std::move(header.phase_id);
    snapshot.scope = std::move(header.scope);
    snapshot.table = std::move(header.table);
    snapshot.state = header.state;
    snapshot.created_at = header.created_at;

    rc = sqlite3_prepare_v2(db,
                            "SELECT row_key, present, image FROM snapshot_images "
                            "WHERE snapshot_id = ? ORDER BY sequence;",
                            -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return result_type(snapshot_error(error_codes::store_error, db_->last_error()));
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        captured_row entry;
        entry.key = column_text(stmt, 0);
        if (sqlite3_column_int(stmt, 1) != 0) {
            auto decoded = core::decode_row(column_text(stmt, 2));
            if (decoded.is_err()) {
                sqlite3_finalize(stmt);
                return result_type(snapshot_error(
                    error_codes::codec_error,
                    compat::format("Snapshot '{}' row '{}': {}", snapshot_id,
                                   entry.key, decoded.error().message)));
            }
            entry.before_image = std::move(decoded.value());
        }
        snapshot.captured.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return result_type(snapshot_error(error_codes::store_error, db_->last_error()));
    }
    return snapshot;
}

auto sqlite_snapshot_store::state_of(std::string_view snapshot_id) const
    -> Result<snapshot_state> {
    std::lock_guard lock(db_->mutex());

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db_->handle(), "SELECT state FROM rollback_snapshots WHERE snapshot_id = ?;",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<snapshot_state>(
            snapshot_error(error_codes::store_error, db_->last_error()));
    }

    auto id = std::string(snapshot_id);
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return Result<snapshot_state>(snapshot_error(
            rc == SQLITE_DONE ? error_codes::snapshot_not_found : error_codes::store_error,
            rc == SQLITE_DONE ? compat::format("Snapshot '{}' not found", snapshot_id)
                              : db_->last_error()));
    }

    auto state = snapshot_state_from_string(column_text(stmt, 0));
    sqlite3_finalize(stmt);
    if (!state) {
        return Result<snapshot_state>(snapshot_error(
            error_codes::store_error,
            compat::format("Snapshot '{}' has an unknown state", snapshot_id)));
    }
    return *state;
}

auto sqlite_snapshot_store::list(std::optional<snapshot_state> state) const
    -> Result<std::vector<snapshot_summary>> {
    using result_type = Result<std::vector<snapshot_summary>>;

    std::lock_guard lock(db_->mutex());

    std::string sql =
        "SELECT s.snapshot_id, s.phase_id, s.scope, s.table_name, s.state, "
        "s.created_at, COUNT(i.sequence) "
        "FROM rollback_snapshots s "
        "LEFT JOIN snapshot_images i ON i.snapshot_id = s.snapshot_id ";
    if (state) {
        sql += "WHERE s.state = ? ";
    }
    sql += "GROUP BY s.snapshot_id ORDER BY s.created_at, s.snapshot_id;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return result_type(snapshot_error(error_codes::store_error, db_->last_error()));
    }

    std::string state_text;
    if (state) {
        state_text = std::string(to_string(*state));
        sqlite3_bind_text(stmt, 1, state_text.c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<snapshot_summary> summaries;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto summary = parse_header(stmt);
        summary.row_count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 6));
        summaries.push_back(std::move(summary));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return result_type(snapshot_error(error_codes::store_error, db_->last_error()));
    }
    return summaries;
}

}  // namespace migrate::engine
