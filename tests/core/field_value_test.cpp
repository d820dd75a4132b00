/**
 * @file field_value_test.cpp
 * @brief Unit tests for field values and type conversions
 */

#include <catch2/catch_test_macros.hpp>

#include <migrate/core/field_value.hpp>

#include <cstdint>
#include <string>

using namespace migrate;
using namespace migrate::core;

TEST_CASE("field_type string conversion", "[core][field_value]") {
    SECTION("to_string covers every type") {
        CHECK(to_string(field_type::null) == "null");
        CHECK(to_string(field_type::integer) == "integer");
        CHECK(to_string(field_type::real) == "real");
        CHECK(to_string(field_type::boolean) == "boolean");
        CHECK(to_string(field_type::text) == "text");
    }

    SECTION("from_string is the inverse") {
        CHECK(field_type_from_string("integer") == field_type::integer);
        CHECK(field_type_from_string("text") == field_type::text);
        CHECK_FALSE(field_type_from_string("varchar").has_value());
    }
}

TEST_CASE("type_of reports the variant alternative", "[core][field_value]") {
    CHECK(type_of(field_value{}) == field_type::null);
    CHECK(type_of(field_value{std::int64_t{42}}) == field_type::integer);
    CHECK(type_of(field_value{1.5}) == field_type::real);
    CHECK(type_of(field_value{true}) == field_type::boolean);
    CHECK(type_of(field_value{std::string{"abc"}}) == field_type::text);
    CHECK(is_null(field_value{}));
    CHECK_FALSE(is_null(field_value{std::int64_t{0}}));
}

TEST_CASE("lossless conversions", "[core][field_value]") {
    SECTION("identity and null are always lossless") {
        CHECK(is_lossless_conversion(field_type::real, field_type::real));
        CHECK(is_lossless_conversion(field_type::null, field_type::integer));
    }

    SECTION("widenings") {
        CHECK(is_lossless_conversion(field_type::boolean, field_type::integer));
        CHECK(is_lossless_conversion(field_type::boolean, field_type::text));
        CHECK(is_lossless_conversion(field_type::integer, field_type::text));
        CHECK(is_lossless_conversion(field_type::real, field_type::text));
    }

    SECTION("narrowings are rejected") {
        CHECK_FALSE(is_lossless_conversion(field_type::text, field_type::integer));
        CHECK_FALSE(is_lossless_conversion(field_type::real, field_type::integer));
        CHECK_FALSE(is_lossless_conversion(field_type::integer, field_type::real));
        CHECK_FALSE(is_lossless_conversion(field_type::integer, field_type::boolean));
    }
}

TEST_CASE("convert_value", "[core][field_value]") {
    SECTION("boolean to integer") {
        auto converted = convert_value(field_value{true}, field_type::integer);
        REQUIRE(converted.is_ok());
        CHECK(converted.value() == field_value{std::int64_t{1}});
    }

    SECTION("integer to text") {
        auto converted = convert_value(field_value{std::int64_t{-17}}, field_type::text);
        REQUIRE(converted.is_ok());
        CHECK(converted.value() == field_value{std::string{"-17"}});
    }

    SECTION("null passes through") {
        auto converted = convert_value(field_value{}, field_type::text);
        REQUIRE(converted.is_ok());
        CHECK(is_null(converted.value()));
    }

    SECTION("text to integer is a type mismatch") {
        auto converted = convert_value(field_value{std::string{"12"}}, field_type::integer);
        REQUIRE(converted.is_err());
        CHECK(converted.error().code == error_codes::type_mismatch);
    }
}

TEST_CASE("to_display_string", "[core][field_value]") {
    CHECK(to_display_string(field_value{}) == "");
    CHECK(to_display_string(field_value{false}) == "false");
    CHECK(to_display_string(field_value{std::int64_t{7}}) == "7");
    CHECK(to_display_string(field_value{std::string{"x y"}}) == "x y");
}
