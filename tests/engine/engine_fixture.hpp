/**
 * @file engine_fixture.hpp
 * @brief Stores, transforms and contexts shared by the engine tests
 */

#pragma once

#include <migrate/engine/field_mapping.hpp>
#include <migrate/engine/run_context.hpp>
#include <migrate/storage/memory_record_store.hpp>
#include <migrate/storage/sqlite_database.hpp>

#include "../storage/test_shapes.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace migrate::test {

/**
 * @brief Registry with grade_to_tier (text -> text) and vip_to_level
 *        (boolean -> integer)
 *
 * grade_to_tier fails for grades other than A and B.
 */
inline auto make_registry() -> std::shared_ptr<engine::transform_registry> {
    auto registry = std::make_shared<engine::transform_registry>();

    (void)registry->register_transform(
        {"grade_to_tier", core::field_type::text, core::field_type::text,
         [](const core::field_value& value) -> Result<core::field_value> {
             const auto& grade = std::get<std::string>(value);
             if (grade == "A") {
                 return core::field_value{std::string{"gold"}};
             }
             if (grade == "B") {
                 return core::field_value{std::string{"silver"}};
             }
             return migrate_error<core::field_value>(error_codes::row_transform_failed,
                                                     "unknown grade " + grade, "test");
         }});

    (void)registry->register_transform(
        {"vip_to_level", core::field_type::boolean, core::field_type::integer,
         [](const core::field_value& value) -> Result<core::field_value> {
             return core::field_value{std::int64_t{std::get<bool>(value) ? 10 : 0}};
         }});

    return registry;
}

/// customer_v1 -> customer_v2 mapping with direct, transform and constant rules
inline auto customer_rules() -> std::vector<engine::field_mapping> {
    return {engine::field_mapping::direct("id", "customer_id"),
            engine::field_mapping::direct("name", "display_name"),
            engine::field_mapping::transform("grade", "tier", "grade_to_tier"),
            engine::field_mapping::transform("vip", "vip_level", "vip_to_level"),
            engine::field_mapping::constant("source", core::field_value{std::string{"legacy"}})};
}

/// Memory store with customer_v1 holding @p count customers and an empty customer_v2
inline auto make_customer_store(std::int64_t count)
    -> std::shared_ptr<storage::memory_record_store> {
    auto store = std::make_shared<storage::memory_record_store>();
    if (store->create_table(customer_v1_shape()).is_err() ||
        store->create_table(customer_v2_shape()).is_err() ||
        store->upsert("customer_v1", make_customers(count)).is_err()) {
        throw std::runtime_error("cannot build customer store");
    }
    return store;
}

inline auto make_context(std::shared_ptr<storage::record_store_interface> store,
                         engine::migration_scope scope = engine::migration_scope::global())
    -> engine::run_context {
    engine::run_context context;
    context.run_id = "run-test";
    context.scope = std::move(scope);
    context.store = std::move(store);
    return context;
}

inline auto open_memory_db() -> std::shared_ptr<storage::sqlite_database> {
    auto db = storage::sqlite_database::open(":memory:");
    if (db.is_err()) {
        throw std::runtime_error(db.error().message);
    }
    return db.value();
}

inline auto grade_is(std::string grade) -> core::row_filter {
    return [grade = std::move(grade)](const core::row& r) {
        return r.get("grade") == core::field_value{grade};
    };
}

}  // namespace migrate::test
