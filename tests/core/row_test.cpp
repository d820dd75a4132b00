/**
 * @file row_test.cpp
 * @brief Unit tests for rows, table shapes and the row codec
 */

#include <catch2/catch_test_macros.hpp>

#include <migrate/core/row.hpp>

#include <cstdint>
#include <string>

using namespace migrate;
using namespace migrate::core;

namespace {

auto customer_shape() -> table_shape {
    return table_shape{"customer",
                       "id",
                       {{"id", field_type::integer, false},
                        {"name", field_type::text, false},
                        {"grade", field_type::text, true},
                        {"active", field_type::boolean, true}}};
}

}  // namespace

// ============================================================================
// table_shape
// ============================================================================

TEST_CASE("table_shape validation", "[core][row][shape]") {
    SECTION("well-formed shape") {
        CHECK(customer_shape().validate().is_ok());
    }

    SECTION("missing name") {
        auto shape = customer_shape();
        shape.name.clear();
        CHECK(shape.validate().is_err());
    }

    SECTION("key field must be declared") {
        auto shape = customer_shape();
        shape.key_field = "customer_id";
        auto result = shape.validate();
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::plan_invalid);
    }

    SECTION("key field must not be nullable") {
        auto shape = customer_shape();
        shape.key_field = "grade";
        CHECK(shape.validate().is_err());
    }

    SECTION("duplicate field names") {
        auto shape = customer_shape();
        shape.fields.push_back({"name", field_type::text, true});
        CHECK(shape.validate().is_err());
    }

    SECTION("find_field") {
        auto shape = customer_shape();
        REQUIRE(shape.find_field("grade") != nullptr);
        CHECK(shape.find_field("grade")->nullable);
        CHECK(shape.find_field("missing") == nullptr);
    }
}

// ============================================================================
// row
// ============================================================================

TEST_CASE("row accessors", "[core][row]") {
    row r{{"id", std::int64_t{1}}, {"name", std::string{"Alice"}}};

    CHECK(r.size() == 2);
    CHECK(r.contains("name"));
    CHECK(r.get("name") == field_value{std::string{"Alice"}});
    CHECK_FALSE(r.get("grade").has_value());

    r.set("grade", std::string{"A"});
    CHECK(r.get("grade") == field_value{std::string{"A"}});

    r.set("grade", std::string{"B"});
    CHECK(r.get("grade") == field_value{std::string{"B"}});

    CHECK(r.erase("grade"));
    CHECK_FALSE(r.erase("grade"));
}

TEST_CASE("row key", "[core][row]") {
    auto shape = customer_shape();

    SECTION("key is the key field rendered as text") {
        row r{{"id", std::int64_t{42}}, {"name", std::string{"Bob"}}};
        auto key = r.key(shape);
        REQUIRE(key.is_ok());
        CHECK(key.value() == "42");
    }

    SECTION("missing key field") {
        row r{{"name", std::string{"Bob"}}};
        CHECK(r.key(shape).is_err());
    }

    SECTION("null key field") {
        row r{{"id", field_value{}}, {"name", std::string{"Bob"}}};
        CHECK(r.key(shape).is_err());
    }
}

TEST_CASE("conforms_to", "[core][row]") {
    auto shape = customer_shape();

    SECTION("conforming row") {
        row r{{"id", std::int64_t{1}}, {"name", std::string{"A"}}, {"active", true}};
        CHECK(conforms_to(r, shape).is_ok());
    }

    SECTION("undeclared field") {
        row r{{"id", std::int64_t{1}}, {"name", std::string{"A"}}, {"email", std::string{"x"}}};
        CHECK(conforms_to(r, shape).is_err());
    }

    SECTION("wrong type") {
        row r{{"id", std::string{"1"}}, {"name", std::string{"A"}}};
        auto result = conforms_to(r, shape);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::type_mismatch);
    }

    SECTION("null in non-nullable field") {
        row r{{"id", std::int64_t{1}}, {"name", field_value{}}};
        CHECK(conforms_to(r, shape).is_err());
    }

    SECTION("missing required field") {
        row r{{"id", std::int64_t{1}}};
        CHECK(conforms_to(r, shape).is_err());
    }

    SECTION("null in nullable field") {
        row r{{"id", std::int64_t{1}}, {"name", std::string{"A"}}, {"grade", field_value{}}};
        CHECK(conforms_to(r, shape).is_ok());
    }
}

TEST_CASE("row filter matching", "[core][row]") {
    row r{{"grade", std::string{"A"}}};

    CHECK(matches(row_filter{}, r));
    CHECK(matches([](const row& x) { return x.get("grade") == field_value{std::string{"A"}}; },
                  r));
    CHECK_FALSE(matches([](const row&) { return false; }, r));
}

// ============================================================================
// Row codec
// ============================================================================

TEST_CASE("row codec", "[core][row][codec]") {
    SECTION("every value type survives encoding") {
        row r{{"id", std::int64_t{-9}},
              {"score", 2.5},
              {"active", true},
              {"note", std::string{"12:colon:n"}},
              {"missing", field_value{}}};

        auto decoded = decode_row(encode_row(r));
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == r);
    }

    SECTION("empty row encodes to empty string") {
        CHECK(encode_row(row{}).empty());
        auto decoded = decode_row("");
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().empty());
    }

    SECTION("truncated input is a codec error") {
        auto encoded = encode_row(row{{"name", std::string{"Alice"}}});
        auto decoded = decode_row(encoded.substr(0, encoded.size() - 2));
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::codec_error);
    }

    SECTION("unknown type tag is a codec error") {
        auto decoded = decode_row("2:idx1:1");
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::codec_error);
    }

    SECTION("invalid boolean text is a codec error") {
        CHECK(decode_row("1:ab3:yes").is_err());
    }
}
