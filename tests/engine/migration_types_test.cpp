/**
 * @file migration_types_test.cpp
 * @brief Unit tests for scopes, tags and phase states
 */

#include <catch2/catch_test_macros.hpp>

#include <migrate/engine/migration_types.hpp>
#include <migrate/engine/run_context.hpp>

using namespace migrate::engine;

TEST_CASE("migration_scope", "[engine][types]") {
    SECTION("global") {
        auto scope = migration_scope::global();
        CHECK(scope.is_global());
        CHECK(scope.to_string() == "global");
        CHECK(scope == migration_scope{});
    }

    SECTION("per tenant") {
        auto scope = migration_scope::per_tenant("acme");
        CHECK_FALSE(scope.is_global());
        CHECK(scope.tenant_id() == "acme");
        CHECK(scope.to_string() == "tenant:acme");
        CHECK_FALSE(scope == migration_scope::per_tenant("globex"));
        CHECK_FALSE(scope == migration_scope::global());
    }

    SECTION("from_string") {
        CHECK(migration_scope::from_string("global") == migration_scope::global());
        CHECK(migration_scope::from_string("tenant:acme") ==
              migration_scope::per_tenant("acme"));
        CHECK_FALSE(migration_scope::from_string("tenant:").has_value());
        CHECK_FALSE(migration_scope::from_string("acme").has_value());
    }
}

TEST_CASE("make_tag_id", "[engine][types]") {
    CHECK(make_tag_id("billing", "split_invoices", "2024-05-01") ==
          "billing-split_invoices-2024-05-01");
}

TEST_CASE("row_error_policy strings", "[engine][types]") {
    CHECK(to_string(row_error_policy::continue_and_report) == "continue_and_report");
    CHECK(row_error_policy_from_string("abort_phase") == row_error_policy::abort_phase);
    CHECK_FALSE(row_error_policy_from_string("retry").has_value());
}

TEST_CASE("phase_status", "[engine][types]") {
    CHECK(is_terminal(phase_status::committed));
    CHECK(is_terminal(phase_status::failed));
    CHECK(is_terminal(phase_status::skipped));
    CHECK_FALSE(is_terminal(phase_status::pending));
    CHECK_FALSE(is_terminal(phase_status::transferring));
    CHECK_FALSE(is_terminal(phase_status::rolling_back));
    CHECK(to_string(phase_status::post_validating) == "post_validating");
}

TEST_CASE("run context helpers", "[engine][types]") {
    SECTION("run ids are unique and prefixed") {
        auto a = generate_run_id();
        auto b = generate_run_id();
        CHECK(a.rfind("run-", 0) == 0);
        CHECK(a != b);
    }

    SECTION("cancellation token copies share the flag") {
        cancellation_token token;
        auto copy = token;
        CHECK_FALSE(copy.is_cancelled());
        token.cancel();
        CHECK(copy.is_cancelled());
    }
}
