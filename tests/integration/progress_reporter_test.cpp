/**
 * @file progress_reporter_test.cpp
 * @brief Unit tests for progress_reporter
 */

#include <migrate/integration/progress_reporter.hpp>

#include <migrate/engine/phase_orchestrator.hpp>

#include <catch2/catch_test_macros.hpp>

#include "../engine/engine_fixture.hpp"

using namespace migrate;
using namespace migrate::engine;
using namespace migrate::integration;

TEST_CASE("progress_reporter folds cumulative batch counters",
          "[progress_reporter]") {
    progress_reporter reporter({0, true});

    run_context context;
    context.run_id = "run-1";

    reporter.on_run_started(context);
    CHECK(reporter.snapshot().running);
    CHECK(reporter.snapshot().run_id == "run-1");

    reporter.on_batch_flushed(context, {"copy", "customer_v2", 1, 100, 2});
    reporter.on_batch_flushed(context, {"copy", "customer_v2", 2, 200, 3});
    reporter.on_batch_flushed(context, {"purge", "customer_v1", 1, 40, 0});

    auto totals = reporter.snapshot();
    CHECK(totals.batches_flushed == 3);
    CHECK(totals.rows_copied == 240);
    CHECK(totals.rows_skipped == 3);

    reporter.on_phase_state(context, "copy", phase_status::post_validating,
                            phase_status::committed);
    reporter.on_phase_state(context, "purge", phase_status::rolling_back,
                            phase_status::failed);
    reporter.on_phase_state(context, "other", phase_status::pending,
                            phase_status::skipped);
    reporter.on_phase_state(context, "other", phase_status::pending,
                            phase_status::validating);

    totals = reporter.snapshot();
    CHECK(totals.phases_committed == 1);
    CHECK(totals.phases_failed == 1);
    CHECK(totals.phases_skipped == 1);

    run_report report;
    reporter.on_run_finished(context, report);
    CHECK_FALSE(reporter.snapshot().running);

    // A new run starts from zero
    context.run_id = "run-2";
    reporter.on_run_started(context);
    CHECK(reporter.snapshot().rows_copied == 0);
    CHECK(reporter.snapshot().run_id == "run-2");
}

TEST_CASE("progress_reporter observes an orchestrated run", "[progress_reporter]") {
    auto store = test::make_customer_store(23);
    auto db = test::open_memory_db();
    phase_orchestrator orchestrator(
        engine_config{}, store, std::make_shared<sqlite_migration_ledger>(db),
        std::make_shared<rollback_manager>(std::make_shared<sqlite_snapshot_store>(db)),
        test::make_registry());

    phase_definition copy;
    copy.id = "copy";
    copy.order = 1;
    copy.batch_size = 5;
    copy.action = std::make_shared<transfer_action>("customer_v1", "customer_v2",
                                                    test::customer_rules());
    REQUIRE(orchestrator.add_phase(std::move(copy)).is_ok());

    phase_definition purge;
    purge.id = "purge";
    purge.order = 2;
    purge.batch_size = 4;
    purge.action = std::make_shared<purge_action>("customer_v1", test::grade_is("A"));
    REQUIRE(orchestrator.add_phase(std::move(purge)).is_ok());

    auto reporter = std::make_shared<progress_reporter>();
    orchestrator.set_observer(reporter);

    auto report = orchestrator.run_per_global();
    REQUIRE(report.overall_success);

    auto totals = reporter->snapshot();
    CHECK(totals.run_id == report.run_id);
    CHECK_FALSE(totals.running);
    CHECK(totals.phases_committed == 2);
    // 5 copy batches (23 rows) and 2 purge batches (7 grade A rows)
    CHECK(totals.batches_flushed == 7);
    CHECK(totals.rows_copied == 30);
}
