/**
 * @file main.cpp
 * @brief migrate_tool - operator utility for the migration ledger
 *
 * Inspects committed tags and restores snapshots that a cancelled or
 * interrupted run left behind.
 *
 * Usage:
 *   migrate_tool tags --ledger-db ledger.db
 *   migrate_tool has-tag billing-split-2024-05-01 --tenant acme
 *   migrate_tool snapshots
 *   migrate_tool restore run-20240501T101500-1a2b3c4d/split/tenant:acme
 */

#include "config.hpp"

#include <migrate/compat/time.hpp>
#include <migrate/engine/migration_ledger.hpp>
#include <migrate/engine/rollback_manager.hpp>
#include <migrate/engine/snapshot_store.hpp>
#include <migrate/integration/logger_adapter.hpp>
#include <migrate/storage/sqlite_database.hpp>
#include <migrate/storage/sqlite_record_store.hpp>

#include <iomanip>
#include <iostream>
#include <memory>

using namespace migrate;

namespace {

constexpr int exit_ok = 0;
constexpr int exit_negative = 1;
constexpr int exit_error = 2;

auto open_database(const std::string& path) -> std::shared_ptr<storage::sqlite_database> {
    auto db = storage::sqlite_database::open(path);
    if (db.is_err()) {
        std::cerr << "Error: " << db.error().message << "\n";
        return nullptr;
    }
    return db.value();
}

auto list_tags(const tool::tool_config& config) -> int {
    auto db = open_database(config.engine.ledger_db_path);
    if (!db) {
        return exit_error;
    }
    engine::sqlite_migration_ledger ledger(db);

    auto tags = ledger.list_tags();
    if (tags.is_err()) {
        std::cerr << "Error: " << tags.error().message << "\n";
        return exit_error;
    }

    std::cout << std::left << std::setw(48) << "TAG" << std::setw(24) << "SCOPE"
              << "APPLIED AT\n";
    for (const auto& tag : tags.value()) {
        std::cout << std::left << std::setw(48) << tag.id << std::setw(24)
                  << tag.scope.to_string() << compat::to_timestamp_string(tag.applied_at)
                  << "\n";
    }
    std::cout << tags.value().size() << " tag(s)\n";
    return exit_ok;
}

auto check_tag(const tool::tool_config& config) -> int {
    auto db = open_database(config.engine.ledger_db_path);
    if (!db) {
        return exit_error;
    }
    engine::sqlite_migration_ledger ledger(db);

    auto scope = config.tenant.empty() ? engine::migration_scope::global()
                                       : engine::migration_scope::per_tenant(config.tenant);
    auto found = ledger.find_tag(config.argument, scope);
    if (found.is_ok()) {
        std::cout << config.argument << " committed for " << scope.to_string() << " at "
                  << compat::to_timestamp_string(found.value().applied_at) << "\n";
        return exit_ok;
    }
    if (found.error().code == error_codes::tag_not_found) {
        std::cout << config.argument << " not committed for " << scope.to_string() << "\n";
        return exit_negative;
    }
    std::cerr << "Error: " << found.error().message << "\n";
    return exit_error;
}

auto make_rollback_manager(const tool::tool_config& config)
    -> std::shared_ptr<engine::rollback_manager> {
    auto db = open_database(config.engine.snapshot_db_path);
    if (!db) {
        return nullptr;
    }
    return std::make_shared<engine::rollback_manager>(
        std::make_shared<engine::sqlite_snapshot_store>(db));
}

auto list_snapshots(const tool::tool_config& config) -> int {
    auto rollback = make_rollback_manager(config);
    if (!rollback) {
        return exit_error;
    }

    auto pending = rollback->pending_snapshots();
    if (pending.is_err()) {
        std::cerr << "Error: " << pending.error().message << "\n";
        return exit_error;
    }

    for (const auto& summary : pending.value()) {
        std::cout << summary.snapshot_id << "\n"
                  << "  phase: " << summary.phase_id << ", scope: "
                  << summary.scope.to_string() << ", table: " << summary.table
                  << ", rows: " << summary.row_count
                  << ", captured: " << compat::to_timestamp_string(summary.created_at)
                  << "\n";
    }
    std::cout << pending.value().size() << " pending snapshot(s)\n";
    return exit_ok;
}

auto restore_snapshot(const tool::tool_config& config) -> int {
    auto rollback = make_rollback_manager(config);
    if (!rollback) {
        return exit_error;
    }
    auto store_db = open_database(config.engine.store_db_path);
    if (!store_db) {
        return exit_error;
    }
    storage::sqlite_record_store store(store_db);

    auto loaded = rollback->load(config.argument);
    if (loaded.is_err()) {
        std::cerr << "Error: " << loaded.error().message << "\n";
        return exit_error;
    }

    auto snapshot = loaded.value();
    auto restored = rollback->restore(snapshot, store);
    if (restored.is_err()) {
        std::cerr << "Error: " << restored.error().message << "\n";
        return exit_error;
    }

    std::cout << "Restored " << snapshot.captured.size() << " row(s) of '" << snapshot.table
              << "' from " << snapshot.snapshot_id << "\n";
    return exit_ok;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = tool::tool_config::parse_args(argc, argv);
    if (!config) {
        return exit_negative;
    }

    integration::logger_adapter::initialize(config->engine.logging);

    int rc = exit_ok;
    switch (config->command) {
        case tool::command_type::tags:
            rc = list_tags(*config);
            break;
        case tool::command_type::has_tag:
            rc = check_tag(*config);
            break;
        case tool::command_type::snapshots:
            rc = list_snapshots(*config);
            break;
        case tool::command_type::restore:
            rc = restore_snapshot(*config);
            break;
    }

    integration::logger_adapter::shutdown();
    return rc;
}
