/**
 * @file rollback_manager_test.cpp
 * @brief Unit tests for rollback_manager and sqlite_snapshot_store
 */

#include <catch2/catch_test_macros.hpp>

#include <migrate/engine/rollback_manager.hpp>

#include "../mocks/fault_injecting_record_store.hpp"
#include "engine_fixture.hpp"

#include <stdexcept>

using namespace migrate;
using namespace migrate::core;
using namespace migrate::engine;

namespace {

struct rollback_fixture {
    std::shared_ptr<storage::sqlite_database> db = test::open_memory_db();
    std::shared_ptr<sqlite_snapshot_store> snapshots =
        std::make_shared<sqlite_snapshot_store>(db);
    rollback_manager manager{snapshots};
    std::shared_ptr<storage::memory_record_store> store = test::make_customer_store(5);
};

}  // namespace

TEST_CASE("rollback_manager construction", "[engine][rollback]") {
    CHECK_THROWS_AS(rollback_manager(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(sqlite_snapshot_store(nullptr), std::invalid_argument);
}

TEST_CASE("rollback_manager snapshot ids", "[engine][rollback]") {
    CHECK(rollback_manager::make_snapshot_id("run-1", "copy", migration_scope::global()) ==
          "run-1/copy/" + migration_scope::global().to_string());
    CHECK(rollback_manager::make_snapshot_id("run-1", "copy",
                                             migration_scope::per_tenant("acme")) !=
          rollback_manager::make_snapshot_id("run-1", "copy",
                                             migration_scope::per_tenant("globex")));
}

TEST_CASE("rollback_manager restores the before state", "[engine][rollback]") {
    rollback_fixture fx;
    const auto before = fx.store->dump("customer_v1").value();

    // 3 and 4 exist, 7 and 8 will be inserted by the "phase"
    auto snapshot = fx.manager.snapshot("s1", "touch", migration_scope::global(),
                                        "customer_v1", {"3", "4", "7", "8"}, *fx.store);
    REQUIRE(snapshot.is_ok());
    REQUIRE(snapshot.value().captured.size() == 4);
    CHECK(snapshot.value().captured[0].before_image.has_value());
    CHECK_FALSE(snapshot.value().captured[2].before_image.has_value());

    // Mutate the captured rows
    REQUIRE(fx.store
                ->upsert("customer_v1", {test::make_customer(3, "changed", "Z"),
                                         test::make_customer(7, "new", "A"),
                                         test::make_customer(8, "new", "B")})
                .is_ok());
    REQUIRE(fx.store->remove("customer_v1", "4").is_ok());

    auto restored = fx.manager.restore(snapshot.value(), *fx.store);
    REQUIRE(restored.is_ok());
    CHECK(snapshot.value().state == snapshot_state::restored);
    CHECK(fx.store->dump("customer_v1").value() == before);

    SECTION("restore is idempotent") {
        REQUIRE(fx.store->upsert("customer_v1", {test::make_customer(7, "again", "A")})
                    .is_ok());
        CHECK(fx.manager.restore(snapshot.value(), *fx.store).is_ok());
        // Already restored; the second call does not replay images
        CHECK(fx.store->contains("customer_v1", "7"));
    }

    SECTION("a restored snapshot cannot be discarded") {
        auto discarded = fx.manager.discard(snapshot.value());
        REQUIRE(discarded.is_err());
        CHECK(discarded.error().code == error_codes::snapshot_failed);
    }

    SECTION("the persisted copy is also restored") {
        auto loaded = fx.manager.load("s1");
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().state == snapshot_state::restored);
        CHECK(fx.manager.restore(loaded.value(), *fx.store).is_ok());
    }
}

TEST_CASE("rollback_manager persists snapshots", "[engine][rollback]") {
    rollback_fixture fx;
    const auto acme = migration_scope::per_tenant("acme");

    auto first = fx.manager.snapshot("s1", "copy", acme, "customer_v1", {"1", "9"},
                                     *fx.store);
    REQUIRE(first.is_ok());

    SECTION("load returns the captured images") {
        auto loaded = fx.manager.load("s1");
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().phase_id == "copy");
        CHECK(loaded.value().scope == acme);
        CHECK(loaded.value().table == "customer_v1");
        REQUIRE(loaded.value().captured.size() == 2);
        CHECK(loaded.value().captured[0].key == "1");
        CHECK(loaded.value().captured[0].before_image ==
              fx.store->get("customer_v1", "1").value());
        CHECK_FALSE(loaded.value().captured[1].before_image.has_value());
    }

    SECTION("duplicate snapshot id") {
        auto again = fx.manager.snapshot("s1", "copy", acme, "customer_v1", {"1"},
                                         *fx.store);
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::snapshot_failed);
    }

    SECTION("unknown snapshot") {
        auto loaded = fx.manager.load("missing");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::snapshot_not_found);
    }

    SECTION("pending snapshots exclude discarded ones") {
        auto second = fx.manager.snapshot("s2", "purge", acme, "customer_v1", {"2"},
                                          *fx.store);
        REQUIRE(second.is_ok());

        auto pending = fx.manager.pending_snapshots();
        REQUIRE(pending.is_ok());
        CHECK(pending.value().size() == 2);

        REQUIRE(fx.manager.discard(first.value()).is_ok());
        CHECK(first.value().state == snapshot_state::discarded);
        CHECK(fx.manager.discard(first.value()).is_ok());

        pending = fx.manager.pending_snapshots();
        REQUIRE(pending.is_ok());
        REQUIRE(pending.value().size() == 1);
        CHECK(pending.value()[0].snapshot_id == "s2");
        CHECK(pending.value()[0].row_count == 1);
    }

    SECTION("a discarded snapshot cannot be restored") {
        REQUIRE(fx.manager.discard(first.value()).is_ok());
        auto restored = fx.manager.restore(first.value(), *fx.store);
        REQUIRE(restored.is_err());
        CHECK(restored.error().code == error_codes::restore_failed);
    }
}

TEST_CASE("rollback_manager reports store failures", "[engine][rollback]") {
    auto db = test::open_memory_db();
    rollback_manager manager(std::make_shared<sqlite_snapshot_store>(db));

    auto store = std::make_shared<storage::testing::fault_injecting_record_store>();
    REQUIRE(store->create_table(test::customer_v1_shape()).is_ok());
    REQUIRE(store->inner().upsert("customer_v1", test::make_customers(3)).is_ok());

    SECTION("unknown table") {
        auto snapshot = manager.snapshot("s1", "copy", migration_scope::global(),
                                         "invoices", {"1"}, *store);
        REQUIRE(snapshot.is_err());
        CHECK(snapshot.error().code == error_codes::snapshot_failed);
    }

    SECTION("restore keeps the snapshot captured on failure") {
        auto snapshot = manager.snapshot("s1", "copy", migration_scope::global(),
                                         "customer_v1", {"1", "4"}, *store);
        REQUIRE(snapshot.is_ok());

        store->fail_all_writes(true);
        auto restored = manager.restore(snapshot.value(), *store);
        REQUIRE(restored.is_err());
        CHECK(restored.error().code == error_codes::restore_failed);
        CHECK(snapshot.value().state == snapshot_state::captured);

        store->fail_all_writes(false);
        CHECK(manager.restore(snapshot.value(), *store).is_ok());
    }
}
