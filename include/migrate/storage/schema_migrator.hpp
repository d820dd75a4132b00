/**
 * @file schema_migrator.hpp
 * @brief Versioned schema setup for the engine's own SQLite tables
 *
 * This file provides the schema_migrator class which creates and evolves
 * the tables backing the migration ledger, the rollback snapshot store and
 * the SQLite record store catalog.
 */

#pragma once

#include <migrate/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace migrate::storage {

/**
 * @brief Represents an applied engine schema version
 */
struct schema_version_record {
    int version;              ///< Schema version number
    std::string description;  ///< Description of the schema change
    std::string applied_at;   ///< Timestamp when the change was applied
};

/**
 * @brief Function type for schema step implementations
 *
 * @param db The SQLite database handle
 * @return VoidResult Success or error information
 */
using schema_step = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Manages the engine's internal SQLite schema
 *
 * Responsibilities:
 * - Tracking the current schema version via the engine_schema_version table
 * - Applying pending schema steps in order
 * - Running every step inside its own transaction
 *
 * Thread Safety: This class is NOT thread-safe. The owning sqlite_database
 * serializes access.
 *
 * @example
 * @code
 * schema_migrator migrator;
 * if (migrator.needs_migration(db)) {
 *     auto result = migrator.run_migrations(db);
 * }
 * @endcode
 */
class schema_migrator {
public:
    schema_migrator();
    ~schema_migrator() = default;

    schema_migrator(const schema_migrator&) = delete;
    auto operator=(const schema_migrator&) -> schema_migrator& = delete;
    schema_migrator(schema_migrator&&) = delete;
    auto operator=(schema_migrator&&) -> schema_migrator& = delete;

    // ========================================================================
    // Schema Operations
    // ========================================================================

    /**
     * @brief Apply all pending schema steps
     *
     * @note A failing step is rolled back; earlier steps stay applied.
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Apply schema steps up to a specific version
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version)
        -> VoidResult;

    // ========================================================================
    // Version Information
    // ========================================================================

    /**
     * @brief Get the current schema version (0 when nothing applied)
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    /**
     * @brief Get applied schema versions in order
     */
    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<schema_version_record>;

private:
    [[nodiscard]] auto ensure_version_table(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto apply_step(sqlite3* db, int version) -> VoidResult;
    [[nodiscard]] auto record_step(sqlite3* db, int version,
                                   std::string_view description) -> VoidResult;
    [[nodiscard]] auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    // Schema steps
    [[nodiscard]] auto create_ledger_tables(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto create_snapshot_tables(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto create_store_catalog(sqlite3* db) -> VoidResult;

    /// Latest schema version (increment when adding steps)
    static constexpr int LATEST_VERSION = 3;

    struct step_entry {
        int version;
        std::string description;
        schema_step apply;
    };

    /// Schema step registry
    std::vector<step_entry> steps_;
};

}  // namespace migrate::storage
