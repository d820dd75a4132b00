/**
 * @file snapshot_store.hpp
 * @brief Durable storage for rollback snapshots
 */

#pragma once

#include <migrate/core/row.hpp>
#include <migrate/engine/migration_types.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::storage {
class sqlite_database;
}  // namespace migrate::storage

namespace migrate::engine {

/**
 * @brief Lifecycle of a snapshot: captured, then restored or discarded
 */
enum class snapshot_state { captured, restored, discarded };

[[nodiscard]] constexpr auto to_string(snapshot_state state) noexcept
    -> std::string_view {
    switch (state) {
        case snapshot_state::captured:
            return "captured";
        case snapshot_state::restored:
            return "restored";
        case snapshot_state::discarded:
            return "discarded";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto snapshot_state_from_string(std::string_view str)
    -> std::optional<snapshot_state> {
    if (str == "captured") {
        return snapshot_state::captured;
    }
    if (str == "restored") {
        return snapshot_state::restored;
    }
    if (str == "discarded") {
        return snapshot_state::discarded;
    }
    return std::nullopt;
}

/**
 * @brief Before-image of one row; std::nullopt means the row did not exist
 */
struct captured_row {
    core::row_key key;
    std::optional<core::row> before_image;
};

/**
 * @brief Before-images of the rows a phase is about to mutate
 */
struct rollback_snapshot {
    std::string snapshot_id;
    std::string phase_id;
    migration_scope scope;
    std::string table;

    /// In capture order; restore replays them in reverse
    std::vector<captured_row> captured;

    snapshot_state state{snapshot_state::captured};
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Snapshot header without the captured rows
 */
struct snapshot_summary {
    std::string snapshot_id;
    std::string phase_id;
    migration_scope scope;
    std::string table;
    snapshot_state state{snapshot_state::captured};
    std::size_t row_count{0};
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Persistence for rollback snapshots
 *
 * save() must be durable when it returns: the transfer starts only after
 * it succeeds.
 */
class snapshot_store_interface {
public:
    virtual ~snapshot_store_interface() = default;

    /**
     * @brief Persist a new snapshot with all captured rows atomically
     * @return snapshot_failed on error (including a duplicate id)
     */
    [[nodiscard]] virtual auto save(const rollback_snapshot& snapshot)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto update_state(std::string_view snapshot_id,
                                            snapshot_state state)
        -> VoidResult = 0;

    /**
     * @return The snapshot or snapshot_not_found
     */
    [[nodiscard]] virtual auto load(std::string_view snapshot_id) const
        -> Result<rollback_snapshot> = 0;

    [[nodiscard]] virtual auto state_of(std::string_view snapshot_id) const
        -> Result<snapshot_state> = 0;

    /**
     * @brief List snapshots, optionally only those in @p state, oldest first
     */
    [[nodiscard]] virtual auto list(std::optional<snapshot_state> state = std::nullopt) const
        -> Result<std::vector<snapshot_summary>> = 0;
};

/**
 * @brief Snapshot store on the rollback_snapshots and snapshot_images tables
 *
 * Before-images are stored with encode_row().
 */
class sqlite_snapshot_store final : public snapshot_store_interface {
public:
    explicit sqlite_snapshot_store(std::shared_ptr<storage::sqlite_database> db);
    ~sqlite_snapshot_store() override = default;

    sqlite_snapshot_store(const sqlite_snapshot_store&) = delete;
    auto operator=(const sqlite_snapshot_store&) -> sqlite_snapshot_store& = delete;

    [[nodiscard]] auto save(const rollback_snapshot& snapshot) -> VoidResult override;

    [[nodiscard]] auto update_state(std::string_view snapshot_id, snapshot_state state)
        -> VoidResult override;

    [[nodiscard]] auto load(std::string_view snapshot_id) const
        -> Result<rollback_snapshot> override;

    [[nodiscard]] auto state_of(std::string_view snapshot_id) const
        -> Result<snapshot_state> override;

    [[nodiscard]] auto list(std::optional<snapshot_state> state = std::nullopt) const
        -> Result<std::vector<snapshot_summary>> override;

private:
    std::shared_ptr<storage::sqlite_database> db_;
};

}  // namespace migrate::engine
