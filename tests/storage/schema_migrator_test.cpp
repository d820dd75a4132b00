/**
 * @file schema_migrator_test.cpp
 * @brief Unit tests for the engine schema migrator
 */

#include <catch2/catch_test_macros.hpp>

#include <migrate/storage/schema_migrator.hpp>

#include <sqlite3.h>

#include <stdexcept>

using namespace migrate::storage;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/// RAII wrapper for SQLite database
class test_database {
public:
    test_database() {
        auto rc = sqlite3_open(":memory:", &db_);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to open in-memory database");
        }
    }

    ~test_database() {
        if (db_ != nullptr) {
            sqlite3_close(db_);
        }
    }

    test_database(const test_database&) = delete;
    auto operator=(const test_database&) -> test_database& = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto object_exists(const char* type, const char* name) const -> bool {
        const char* sql = "SELECT name FROM sqlite_master WHERE type=? AND name=?;";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, type, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, name, -1, SQLITE_TRANSIENT);
        auto rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW;
    }

private:
    sqlite3* db_ = nullptr;
};

}  // namespace

TEST_CASE("schema_migrator initial state", "[storage][schema]") {
    test_database db;
    schema_migrator migrator;

    CHECK(migrator.get_current_version(db.get()) == 0);
    CHECK(migrator.needs_migration(db.get()));
    CHECK(migrator.get_latest_version() == 3);
    CHECK(migrator.get_history(db.get()).empty());
}

TEST_CASE("schema_migrator run_migrations", "[storage][schema]") {
    test_database db;
    schema_migrator migrator;

    SECTION("creates every table") {
        REQUIRE(migrator.run_migrations(db.get()).is_ok());

        CHECK(db.object_exists("table", "engine_schema_version"));
        CHECK(db.object_exists("table", "migration_tags"));
        CHECK(db.object_exists("table", "rollback_snapshots"));
        CHECK(db.object_exists("table", "snapshot_images"));
        CHECK(db.object_exists("table", "store_tables"));
        CHECK(db.object_exists("table", "store_columns"));
        CHECK(db.object_exists("trigger", "trg_migration_tags_immutable"));
    }

    SECTION("is idempotent") {
        REQUIRE(migrator.run_migrations(db.get()).is_ok());
        REQUIRE(migrator.run_migrations(db.get()).is_ok());
        CHECK(migrator.get_current_version(db.get()) == 3);
        CHECK_FALSE(migrator.needs_migration(db.get()));
    }

    SECTION("records history") {
        REQUIRE(migrator.run_migrations(db.get()).is_ok());
        auto history = migrator.get_history(db.get());
        REQUIRE(history.size() == 3);
        CHECK(history[0].description == "Create migration ledger");
        CHECK(history[1].description == "Create rollback snapshot store");
        CHECK(history[2].description == "Create record store catalog");
        CHECK_FALSE(history[0].applied_at.empty());
    }

    SECTION("partial migration") {
        REQUIRE(migrator.run_migrations_to(db.get(), 1).is_ok());
        CHECK(migrator.get_current_version(db.get()) == 1);
        CHECK(db.object_exists("table", "migration_tags"));
        CHECK_FALSE(db.object_exists("table", "rollback_snapshots"));

        REQUIRE(migrator.run_migrations(db.get()).is_ok());
        CHECK(db.object_exists("table", "rollback_snapshots"));
    }

    SECTION("target beyond latest is rejected") {
        CHECK(migrator.run_migrations_to(db.get(), 99).is_err());
    }
}

TEST_CASE("migration_tags is append-only", "[storage][schema]") {
    test_database db;
    schema_migrator migrator;
    REQUIRE(migrator.run_migrations(db.get()).is_ok());

    REQUIRE(sqlite3_exec(db.get(),
                         "INSERT INTO migration_tags (tag_id, scope) VALUES ('a', 'global');",
                         nullptr, nullptr, nullptr) == SQLITE_OK);
    CHECK(sqlite3_exec(db.get(), "UPDATE migration_tags SET scope = 'tenant:x';", nullptr,
                       nullptr, nullptr) != SQLITE_OK);
    CHECK(sqlite3_exec(db.get(),
                       "INSERT INTO migration_tags (tag_id, scope) VALUES ('a', 'global');",
                       nullptr, nullptr, nullptr) != SQLITE_OK);
}
