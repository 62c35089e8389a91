#include <catch2/catch_test_macros.hpp>

#include <jcailloux/ecluse/io/mysql/MySqlParams.h>
#include <jcailloux/ecluse/valuegen/Guid.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using namespace jcailloux::ecluse;
using namespace jcailloux::ecluse::io;
using update::DbValue;
using update::ParameterList;

// =============================================================================
// Literals
// =============================================================================

TEST_CASE("literals render per value type", "[mysql][params]") {
    REQUIRE(renderLiteral(DbValue{}) == "NULL");
    REQUIRE(renderLiteral(DbValue{true}) == "TRUE");
    REQUIRE(renderLiteral(DbValue{false}) == "FALSE");
    REQUIRE(renderLiteral(DbValue{int32_t{-12}}) == "-12");
    REQUIRE(renderLiteral(DbValue{int64_t{9'000'000'000}}) == "9000000000");
    REQUIRE(renderLiteral(DbValue{2.5}) == "2.5");
    REQUIRE(renderLiteral(DbValue{std::string("plain")}) == "'plain'");

    auto guid = valuegen::Guid::parse("0123ABCD-0000-4000-8000-00000000002a");
    REQUIRE(guid.has_value());
    REQUIRE(renderLiteral(DbValue{*guid}) == "'0123abcd-0000-4000-8000-00000000002a'");
}

TEST_CASE("non-finite doubles are refused", "[mysql][params]") {
    REQUIRE_THROWS_AS(renderLiteral(DbValue{std::numeric_limits<double>::infinity()}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(renderLiteral(DbValue{std::numeric_limits<double>::quiet_NaN()}),
                      std::invalid_argument);
}

TEST_CASE("default escaping covers the MySQL specials", "[mysql][params]") {
    REQUIRE(defaultEscape("O'Brien") == "O\\'Brien");
    REQUIRE(defaultEscape("a\\b") == "a\\\\b");
    REQUIRE(defaultEscape("say \"hi\"") == "say \\\"hi\\\"");
    REQUIRE(defaultEscape("l1\nl2\r") == "l1\\nl2\\r");
    REQUIRE(defaultEscape(std::string_view("x\0y\x1a", 4)) == "x\\0y\\Z");
}

TEST_CASE("string literals go through the supplied escaper", "[mysql][params]") {
    Escaper upper = [](std::string_view s) {
        std::string out(s);
        for (auto& c : out) if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        return out;
    };
    REQUIRE(renderLiteral(DbValue{std::string("abc")}, upper) == "'ABC'");
}

// =============================================================================
// Interpolation
// =============================================================================

TEST_CASE("parameters are replaced by literals", "[mysql][params]") {
    ParameterList params{{"p0", std::string("a'b")}, {"p1", int64_t{42}}};
    REQUIRE(interpolate("UPDATE `t` SET `a` = @p0 WHERE `id` = @p1;\n", params)
            == "UPDATE `t` SET `a` = 'a\\'b' WHERE `id` = 42;\n");
}

TEST_CASE("longer names are not shadowed by their prefixes", "[mysql][params]") {
    ParameterList params{{"p1", int64_t{1}}, {"p10", int64_t{10}}, {"p100", int64_t{100}}};
    REQUIRE(interpolate("VALUES (@p1, @p10, @p100)", params) == "VALUES (1, 10, 100)");
}

TEST_CASE("NULL parameters render as NULL", "[mysql][params]") {
    ParameterList params{{"p0", DbValue{}}};
    REQUIRE(interpolate("INSERT INTO `t` (`a`) VALUES (@p0);", params)
            == "INSERT INTO `t` (`a`) VALUES (NULL);");
}

TEST_CASE("quoted text is left alone", "[mysql][params]") {
    ParameterList params{{"p0", int64_t{1}}};

    SECTION("single quotes") {
        REQUIRE(interpolate("SELECT '@p0', @p0", params) == "SELECT '@p0', 1");
    }
    SECTION("escaped quote inside a string") {
        REQUIRE(interpolate("SELECT 'it\\'s @p0', @p0", params) == "SELECT 'it\\'s @p0', 1");
    }
    SECTION("double quotes") {
        REQUIRE(interpolate("SELECT \"@p0\" , @p0", params) == "SELECT \"@p0\" , 1");
    }
    SECTION("backtick identifiers") {
        REQUIRE(interpolate("SELECT `@p0` FROM `t` WHERE `x` = @p0", params)
                == "SELECT `@p0` FROM `t` WHERE `x` = 1");
    }
}

TEST_CASE("comments are left alone", "[mysql][params]") {
    ParameterList params{{"p0", int64_t{5}}};

    REQUIRE(interpolate("SELECT @p0; -- uses @p0\nSELECT @p0", params)
            == "SELECT 5; -- uses @p0\nSELECT 5");
    REQUIRE(interpolate("SELECT @p0 # @p0\n", params) == "SELECT 5 # @p0\n");
    REQUIRE(interpolate("SELECT /* @p0 */ @p0", params) == "SELECT /* @p0 */ 5");
    // "--" without trailing whitespace is two minus signs
    REQUIRE(interpolate("SELECT 1--@p0", params) == "SELECT 1--5");
}

TEST_CASE("server and unknown variables pass through", "[mysql][params]") {
    ParameterList params{{"p0", int64_t{5}}};
    REQUIRE(interpolate("SELECT @@session.sql_mode, @other, @p0, @", params)
            == "SELECT @@session.sql_mode, @other, 5, @");
}

TEST_CASE("duplicate parameter names are rejected", "[mysql][params]") {
    ParameterList params{{"p0", int64_t{1}}, {"p0", int64_t{2}}};
    REQUIRE_THROWS_AS(interpolate("SELECT @p0", params), std::invalid_argument);
}
