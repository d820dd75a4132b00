/**
 * @file engine_config.hpp
 * @brief Engine-wide configuration
 */

#pragma once

#include <migrate/engine/migration_types.hpp>
#include <migrate/integration/logger_adapter.hpp>

#include <cstddef>
#include <string>

namespace migrate::engine {

/**
 * @brief Defaults applied to every run of an orchestrator
 *
 * Phase definitions may override batch size and row error policy.
 */
struct engine_config {
    /// Rows per upsert when a phase does not set its own batch size
    std::size_t default_batch_size{500};

    /// Row error policy when a phase does not set its own
    row_error_policy default_row_error_policy{row_error_policy::continue_and_report};

    /// Concurrent batch flushes per phase (1 = sequential)
    std::size_t max_parallel_batches{1};

    /// Stop the run at the first failed non-independent phase
    bool halt_on_failure{true};

    /// Ledger database file
    std::string ledger_db_path{"migrate_ledger.db"};

    /// Snapshot database file (may equal ledger_db_path)
    std::string snapshot_db_path{"migrate_ledger.db"};

    /// Record store database file for the SQLite backend
    std::string store_db_path{"migrate_store.db"};

    integration::logger_config logging;
};

}  // namespace migrate::engine
