/**
 * @file rollback_manager.hpp
 * @brief Captures before-images ahead of a phase and restores them on failure
 *
 * The snapshot is persisted before snapshot() returns, so a transfer never
 * mutates a row whose before-image is not durable.
 */

#pragma once

#include <migrate/engine/snapshot_store.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace migrate::storage {
class record_store_interface;
}  // namespace migrate::storage

namespace migrate::engine {

/**
 * @brief Creates, restores and discards rollback snapshots
 *
 * Thread Safety: one manager may serve several runs; each snapshot must be
 * restored or discarded by one caller at a time.
 */
class rollback_manager {
public:
    /// Rows written per upsert call while restoring
    static constexpr std::size_t restore_batch_size = 256;

    explicit rollback_manager(std::shared_ptr<snapshot_store_interface> snapshots);

    /**
     * @brief Capture and persist before-images of @p keys in @p table
     *
     * @param snapshot_id Unique snapshot identifier
     * @return The persisted snapshot, or snapshot_failed
     */
    [[nodiscard]] auto snapshot(const std::string& snapshot_id,
                                const std::string& phase_id,
                                const migration_scope& scope,
                                const std::string& table,
                                const std::vector<core::row_key>& keys,
                                const storage::record_store_interface& store)
        -> Result<rollback_snapshot>;

    /**
     * @brief Replay before-images in reverse capture order
     *
     * Rows that were absent are deleted, present rows are upserted back.
     * Restoring an already restored snapshot is a no-op.
     *
     * @return ok(), or restore_failed; the snapshot stays captured on failure
     */
    [[nodiscard]] auto restore(rollback_snapshot& snapshot,
                               storage::record_store_interface& store)
        -> VoidResult;

    /**
     * @brief Mark a snapshot as no longer needed after phase success
     */
    [[nodiscard]] auto discard(rollback_snapshot& snapshot) -> VoidResult;

    /**
     * @brief Snapshots still in captured state (cancelled or interrupted phases)
     */
    [[nodiscard]] auto pending_snapshots() const
        -> Result<std::vector<snapshot_summary>>;

    [[nodiscard]] auto load(const std::string& snapshot_id) const
        -> Result<rollback_snapshot>;

    /**
     * @brief Build the snapshot id used for a phase in a run
     */
    [[nodiscard]] static auto make_snapshot_id(const std::string& run_id,
                                               const std::string& phase_id,
                                               const migration_scope& scope)
        -> std::string;

private:
    std::shared_ptr<snapshot_store_interface> snapshots_;
};

}  // namespace migrate::engine
