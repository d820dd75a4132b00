/**
 * @file rollback_manager.cpp
 * @brief Implementation of the rollback manager
 */

#include <migrate/engine/rollback_manager.hpp>

#include <migrate/compat/format.hpp>
#include <migrate/integration/logger_adapter.hpp>
#include <migrate/storage/record_store.hpp>

#include <stdexcept>

namespace migrate::engine {

using integration::logger_adapter;

rollback_manager::rollback_manager(std::shared_ptr<snapshot_store_interface> snapshots)
    : snapshots_(std::move(snapshots)) {
    if (!snapshots_) {
        throw std::invalid_argument("rollback_manager requires a snapshot store");
    }
}

auto rollback_manager::make_snapshot_id(const std::string& run_id,
                                        const std::string& phase_id,
                                        const migration_scope& scope) -> std::string {
    return compat::format("{}/{}/{}", run_id, phase_id, scope.to_string());
}

auto rollback_manager::snapshot(const std::string& snapshot_id,
                                const std::string& phase_id,
                                const migration_scope& scope,
                                const std::string& table,
                                const std::vector<core::row_key>& keys,
                                const storage::record_store_interface& store)
    -> Result<rollback_snapshot> {
    using result_type = Result<rollback_snapshot>;

    rollback_snapshot snapshot;
    snapshot.snapshot_id = snapshot_id;
    snapshot.phase_id = phase_id;
    snapshot.scope = scope;
    snapshot.table = table;
    snapshot.state = snapshot_state::captured;
    snapshot.created_at = std::chrono::system_clock::now();
    snapshot.captured.reserve(keys.size());

    for (const auto& key : keys) {
        auto current = store.get(table, key);
        if (current.is_ok()) {
            snapshot.captured.push_back({key, std::move(current.value())});
        } else if (current.error().code == error_codes::record_not_found) {
            snapshot.captured.push_back({key, std::nullopt});
        } else {
            return result_type(error_info{
                error_codes::snapshot_failed,
                compat::format("Cannot capture row '{}' of '{}': {}", key, table,
                               current.error().message),
                "rollback"});
        }
    }

    auto saved = snapshots_->save(snapshot);
    if (saved.is_err()) {
        return result_type(error_info{error_codes::snapshot_failed,
                                      saved.error().message, "rollback"});
    }

    logger_adapter::info("Phase {} [{}]: snapshot {} captured {} rows of '{}'",
                         phase_id, scope.to_string(), snapshot_id,
                         snapshot.captured.size(), table);
    return snapshot;
}

auto rollback_manager::restore(rollback_snapshot& snapshot,
                               storage::record_store_interface& store) -> VoidResult {
    auto fail = [&](const std::string& message, std::size_t restored) {
        logger_adapter::log_rollback(snapshot.phase_id, snapshot.scope.to_string(),
                                     snapshot.snapshot_id, restored, false, message);
        return migrate_void_error(error_codes::restore_failed, message, "rollback");
    };

    if (snapshot.state == snapshot_state::restored) {
        return ok();
    }

    auto persisted = snapshots_->state_of(snapshot.snapshot_id);
    if (persisted.is_err()) {
        return fail(persisted.error().message, 0);
    }
    if (persisted.value() == snapshot_state::restored) {
        snapshot.state = snapshot_state::restored;
        return ok();
    }
    if (persisted.value() == snapshot_state::discarded ||
        snapshot.state == snapshot_state::discarded) {
        return fail(compat::format("Snapshot '{}' was discarded", snapshot.snapshot_id), 0);
    }

    std::size_t restored = 0;
    std::vector<core::row> pending;
    pending.reserve(restore_batch_size);

    auto flush = [&]() -> VoidResult {
        if (pending.empty()) {
            return ok();
        }
        auto written = store.upsert(snapshot.table, pending);
        if (written.is_err()) {
            return written;
        }
        restored += pending.size();
        pending.clear();
        return ok();
    };

    for (auto it = snapshot.captured.rbegin(); it != snapshot.captured.rend(); ++it) {
        if (it->before_image) {
            pending.push_back(*it->before_image);
            if (pending.size() >= restore_batch_size) {
                auto flushed = flush();
                if (flushed.is_err()) {
                    return fail(flushed.error().message, restored);
                }
            }
            continue;
        }

        // Keep reverse order: earlier present rows go out before this delete
        auto flushed = flush();
        if (flushed.is_err()) {
            return fail(flushed.error().message, restored);
        }
        auto removed = store.remove(snapshot.table, it->key);
        if (removed.is_err()) {
            return fail(compat::format("Cannot delete row '{}': {}", it->key,
                                       removed.error().message),
                        restored);
        }
        ++restored;
    }

    auto flushed = flush();
    if (flushed.is_err()) {
        return fail(flushed.error().message, restored);
    }

    auto marked = snapshots_->update_state(snapshot.snapshot_id, snapshot_state::restored);
    if (marked.is_err()) {
        return fail(compat::format("Rows restored but state not recorded: {}",
                                   marked.error().message),
                    restored);
    }

    snapshot.state = snapshot_state::restored;
    logger_adapter::log_rollback(snapshot.phase_id, snapshot.scope.to_string(),
                                 snapshot.snapshot_id, restored, true);
    return ok();
}

auto rollback_manager::discard(rollback_snapshot& snapshot) -> VoidResult {
    if (snapshot.state == snapshot_state::discarded) {
        return ok();
    }
    if (snapshot.state == snapshot_state::restored) {
        return migrate_void_error(
            error_codes::snapshot_failed,
            compat::format("Snapshot '{}' was already restored", snapshot.snapshot_id),
            "rollback");
    }

    auto marked = snapshots_->update_state(snapshot.snapshot_id, snapshot_state::discarded);
    if (marked.is_err()) {
        return marked;
    }

    snapshot.state = snapshot_state::discarded;
    logger_adapter::debug("Snapshot {} discarded", snapshot.snapshot_id);
    return ok();
}

auto rollback_manager::pending_snapshots() const
    -> Result<std::vector<snapshot_summary>> {
    return snapshots_->list(snapshot_state::captured);
}

auto rollback_manager::load(const std::string& snapshot_id) const
    -> Result<rollback_snapshot> {
    return snapshots_->load(snapshot_id);
}

}  // namespace migrate::engine
