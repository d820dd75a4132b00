/**
 * @file mapping_compiler_test.cpp
 * @brief Unit tests for the field mapping compiler and transform registry
 */

#include <catch2/catch_test_macros.hpp>

#include <migrate/engine/mapping_compiler.hpp>

#include "engine_fixture.hpp"

#include <algorithm>
#include <stdexcept>

using namespace migrate;
using namespace migrate::core;
using namespace migrate::engine;

namespace {

auto has_violation(const std::vector<mapping_violation>& violations,
                   const std::string& source, const std::string& target) -> bool {
    return std::any_of(violations.begin(), violations.end(),
                       [&](const mapping_violation& v) {
                           return v.source_field == source && v.target_field == target;
                       });
}

}  // namespace

// ============================================================================
// transform_registry
// ============================================================================

TEST_CASE("transform_registry", "[engine][mapping][registry]") {
    auto registry = test::make_registry();

    SECTION("lookup") {
        CHECK(registry->contains("grade_to_tier"));
        auto descriptor = registry->find("vip_to_level");
        REQUIRE(descriptor.has_value());
        CHECK(descriptor->input_type == field_type::boolean);
        CHECK(descriptor->output_type == field_type::integer);
        CHECK_FALSE(registry->find("missing").has_value());
        CHECK(registry->names().size() == 2);
    }

    SECTION("duplicate name is rejected") {
        auto result = registry->register_transform(
            {"grade_to_tier", field_type::text, field_type::text,
             [](const field_value& v) -> Result<field_value> { return v; }});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::plan_invalid);
    }

    SECTION("missing function is rejected") {
        CHECK(registry->register_transform({"noop", field_type::text, field_type::text, {}})
                  .is_err());
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("mapping_compiler accepts a valid mapping", "[engine][mapping]") {
    mapping_compiler compiler(test::make_registry());

    auto violations = compiler.validate(test::customer_v1_shape(), test::customer_v2_shape(),
                                        test::customer_rules());
    CHECK(violations.empty());

    auto plan = compiler.compile(test::customer_v1_shape(), test::customer_v2_shape(),
                                 test::customer_rules());
    REQUIRE(plan.is_ok());
    CHECK(plan.value().rules().size() == 5);
    CHECK(plan.value().target_shape() == test::customer_v2_shape());
}

TEST_CASE("mapping_compiler reports the exact field pair", "[engine][mapping]") {
    mapping_compiler compiler(test::make_registry());
    const auto source = test::customer_v1_shape();
    const auto target = test::customer_v2_shape();

    SECTION("missing source field") {
        auto rules = test::customer_rules();
        rules[1] = field_mapping::direct("full_name", "display_name");
        auto violations = compiler.validate(source, target, rules);
        REQUIRE(violations.size() == 1);
        CHECK(violations[0].source_field == "full_name");
        CHECK(violations[0].target_field == "display_name");
        CHECK(violations[0].to_string() ==
              "full_name -> display_name: source field does not exist");
    }

    SECTION("missing target field") {
        auto rules = test::customer_rules();
        rules.push_back(field_mapping::direct("grade", "segment"));
        auto violations = compiler.validate(source, target, rules);
        REQUIRE(violations.size() == 1);
        CHECK(has_violation(violations, "grade", "segment"));
    }

    SECTION("narrowing direct mapping") {
        auto rules = test::customer_rules();
        rules[0] = field_mapping::direct("name", "customer_id");
        auto violations = compiler.validate(source, target, rules);
        CHECK(has_violation(violations, "name", "customer_id"));
    }

    SECTION("lossless widening is accepted") {
        auto rules = test::customer_rules();
        rules[3] = field_mapping::direct("vip", "vip_level");
        CHECK(compiler.validate(source, target, rules).empty());
    }

    SECTION("target mapped twice") {
        auto rules = test::customer_rules();
        rules.push_back(field_mapping::direct("grade", "tier"));
        auto violations = compiler.validate(source, target, rules);
        REQUIRE(violations.size() == 1);
        CHECK(violations[0].reason == "target field is mapped more than once");
    }

    SECTION("unmapped key and required fields") {
        std::vector<field_mapping> rules{field_mapping::direct("grade", "tier")};
        auto violations = compiler.validate(source, target, rules);
        CHECK(has_violation(violations, "", "customer_id"));
        CHECK(has_violation(violations, "", "display_name"));
        CHECK(has_violation(violations, "", "source"));
        CHECK_FALSE(has_violation(violations, "", "vip_level"));
    }

    SECTION("constant of the wrong type") {
        auto rules = test::customer_rules();
        rules[3] = field_mapping::constant("vip_level", field_value{std::string{"high"}});
        auto violations = compiler.validate(source, target, rules);
        REQUIRE(violations.size() == 1);
        CHECK(has_violation(violations, "", "vip_level"));
    }

    SECTION("NULL constant into a non-nullable field") {
        auto rules = test::customer_rules();
        rules[4] = field_mapping::constant("source", field_value{});
        CHECK(has_violation(compiler.validate(source, target, rules), "", "source"));
    }

    SECTION("unregistered transform") {
        auto rules = test::customer_rules();
        rules[2] = field_mapping::transform("grade", "tier", "grade_to_band");
        auto violations = compiler.validate(source, target, rules);
        REQUIRE(violations.size() == 1);
        CHECK(violations[0].to_string() ==
              "grade -> tier: transform 'grade_to_band' is not registered");
    }

    SECTION("transform input type mismatch") {
        auto rules = test::customer_rules();
        rules[2] = field_mapping::transform("name", "vip_level", "vip_to_level");
        rules.erase(rules.begin() + 3);
        auto violations = compiler.validate(source, target, rules);
        CHECK(has_violation(violations, "name", "vip_level"));
    }

    SECTION("no registry means no transforms") {
        mapping_compiler bare;
        auto violations = bare.validate(source, target, test::customer_rules());
        CHECK(has_violation(violations, "grade", "tier"));
        CHECK(has_violation(violations, "vip", "vip_level"));
    }

    SECTION("every violation is collected") {
        std::vector<field_mapping> rules{
            field_mapping::direct("id", "customer_id"),
            field_mapping::direct("nope", "display_name"),
            field_mapping::transform("grade", "tier", "unknown"),
            field_mapping::constant("source", field_value{std::int64_t{3}}),
            field_mapping::constant("vip_level", field_value{std::string{"high"}}),
            field_mapping::direct("vip", "missing_target")};
        auto violations = compiler.validate(source, target, rules);
        CHECK(violations.size() == 4);

        auto plan = compiler.compile(source, target, rules);
        REQUIRE(plan.is_err());
        CHECK(plan.error().code == error_codes::mapping_compile_error);
        CHECK(plan.error().message.find("nope -> display_name") != std::string::npos);
        CHECK(plan.error().message.find("vip -> missing_target") != std::string::npos);
    }
}

// ============================================================================
// mapping_plan::apply
// ============================================================================

TEST_CASE("mapping_plan apply", "[engine][mapping][apply]") {
    mapping_compiler compiler(test::make_registry());
    auto compiled = compiler.compile(test::customer_v1_shape(), test::customer_v2_shape(),
                                     test::customer_rules());
    REQUIRE(compiled.is_ok());
    const auto& plan = compiled.value();

    SECTION("builds the target row") {
        auto mapped = plan.apply(test::make_customer(7, "Grace", "A", true));
        REQUIRE(mapped.is_ok());
        CHECK(mapped.value() == row{{"customer_id", std::int64_t{7}},
                                    {"display_name", std::string{"Grace"}},
                                    {"tier", std::string{"gold"}},
                                    {"vip_level", std::int64_t{10}},
                                    {"source", std::string{"legacy"}}});
    }

    SECTION("NULL source values are omitted") {
        auto source = row{{"id", std::int64_t{8}}, {"name", std::string{"Ada"}}};
        auto mapped = plan.apply(source);
        REQUIRE(mapped.is_ok());
        CHECK_FALSE(mapped.value().contains("tier"));
        CHECK_FALSE(mapped.value().contains("vip_level"));
    }

    SECTION("transform error is a row error") {
        auto mapped = plan.apply(test::make_customer(9, "Linus", "Z"));
        REQUIRE(mapped.is_err());
        CHECK(mapped.error().code == error_codes::row_transform_failed);
        CHECK(mapped.error().message.find("tier") != std::string::npos);
    }

    SECTION("NULL into a non-nullable target is a row error") {
        auto source = row{{"id", std::int64_t{10}}};
        auto mapped = plan.apply(source);
        REQUIRE(mapped.is_err());
        CHECK(mapped.error().code == error_codes::row_transform_failed);
    }

    SECTION("throwing transform is a row error") {
        auto registry = std::make_shared<transform_registry>();
        REQUIRE(registry
                    ->register_transform({"explode", field_type::text, field_type::text,
                                          [](const field_value&) -> Result<field_value> {
                                              throw std::runtime_error("boom");
                                          }})
                    .is_ok());
        mapping_compiler throwing(registry);
        auto rules = test::customer_rules();
        rules[2] = field_mapping::transform("grade", "tier", "explode");
        rules[3] = field_mapping::direct("vip", "vip_level");

        auto exploding = throwing.compile(test::customer_v1_shape(),
                                          test::customer_v2_shape(), rules);
        REQUIRE(exploding.is_ok());
        auto mapped = exploding.value().apply(test::make_customer(1, "x", "A"));
        REQUIRE(mapped.is_err());
        CHECK(mapped.error().message.find("boom") != std::string::npos);
    }
}
