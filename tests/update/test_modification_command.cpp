#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <jcailloux/ecluse/update/ModificationCommand.h>

#include <fixtures/Commands.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using namespace jcailloux::ecluse::update;
using namespace ecluse_test;

// =============================================================================
// Parameter slots and propagation flags
// =============================================================================

TEST_CASE("ParameterNameGenerator yields p0, p1, ...", "[command]") {
    ParameterNameGenerator names;
    REQUIRE(names.generateNext() == "p0");
    REQUIRE(names.generateNext() == "p1");
    names.reset();
    REQUIRE(names.generateNext() == "p0");
}

TEST_CASE("parameterCount counts write and original value slots", "[command]") {
    ParameterNameGenerator names;

    auto insert = insertRow(names, "orders", {{"name", std::string("a")}, {"note", std::string("b")}});
    REQUIRE(insert.parameterCount() == 2);

    auto update = updateRow(names, "orders", 7, {{"name", std::string("c")}});
    REQUIRE(update.parameterCount() == 2);

    auto del = deleteRow(names, "orders", 7);
    REQUIRE(del.parameterCount() == 1);

    ModificationCommand both("t", {}, EntityState::Modified);
    both.addColumn({.column_name = "v", .is_write = true, .is_condition = true,
                    .parameter_name = "x", .original_parameter_name = "y"});
    REQUIRE(both.parameterCount() == 2);
}

TEST_CASE("requiresResultPropagation follows read columns", "[command]") {
    ParameterNameGenerator names;
    REQUIRE(insertRow(names, "orders", {{"name", std::string("a")}}).requiresResultPropagation());
    REQUIRE_FALSE(insertRow(names, "orders", {{"name", std::string("a")}}, false).requiresResultPropagation());
    REQUIRE_FALSE(updateRow(names, "orders", 1, {{"name", std::string("a")}}).requiresResultPropagation());
    REQUIRE(updateRow(names, "orders", 1, {{"name", std::string("a")}},
                      {{"version", ColumnType::Int32}}).requiresResultPropagation());
}

// =============================================================================
// propagateResults
// =============================================================================

TEST_CASE("propagateResults writes read columns in order", "[command][propagation]") {
    ParameterNameGenerator names;
    auto cmd = updateRow(names, "orders", 3, {{"name", std::string("x")}},
                         {{"version", ColumnType::Int32}, {"total", ColumnType::Double},
                          {"label", ColumnType::String}});

    cmd.propagateResults({std::string("5"), std::string("12.5"), std::nullopt});

    const auto& cols = cmd.columnModifications();
    REQUIRE(std::get<int32_t>(cols[2].value) == 5);
    REQUIRE(std::get<double>(cols[3].value) == Catch::Approx(12.5));
    REQUIRE(isNull(cols[4].value));
    // Written and key columns are untouched
    REQUIRE(std::get<std::string>(cols[0].value) == "x");
    REQUIRE(std::get<int64_t>(cols[1].value) == 3);
}

TEST_CASE("propagateResults rejects a row of the wrong width", "[command][propagation]") {
    ParameterNameGenerator names;
    auto cmd = updateRow(names, "orders", 3, {{"name", std::string("x")}}, {{"version", ColumnType::Int32}});
    REQUIRE_THROWS_AS(cmd.propagateResults({std::string("1"), std::string("2")}), std::invalid_argument);
}

TEST_CASE("propagateResults rejects unconvertible text", "[command][propagation]") {
    ParameterNameGenerator names;
    auto cmd = updateRow(names, "orders", 3, {{"name", std::string("x")}}, {{"version", ColumnType::Int32}});
    REQUIRE_THROWS_AS(cmd.propagateResults({std::string("abc")}), std::invalid_argument);
}

// =============================================================================
// assignGeneratedKey
// =============================================================================

TEST_CASE("assignGeneratedKey stores int64 for a 64-bit key", "[command][identity]") {
    ParameterNameGenerator names;
    auto cmd = insertRow(names, "orders", {{"name", std::string("a")}});
    cmd.assignGeneratedKey(0, 9'000'000'000LL);
    REQUIRE(std::get<int64_t>(cmd.columnModifications()[0].value) == 9'000'000'000LL);
}

TEST_CASE("assignGeneratedKey converts to int32 for a 32-bit key", "[command][identity]") {
    ModificationCommand cmd("users", {}, EntityState::Added);
    cmd.addColumn({.column_name = "id", .column_type = ColumnType::Int32, .is_read = true, .is_key = true});

    cmd.assignGeneratedKey(0, 41);
    REQUIRE(std::holds_alternative<int32_t>(cmd.columnModifications()[0].value));
    REQUIRE(std::get<int32_t>(cmd.columnModifications()[0].value) == 41);

    const int64_t tooBig = int64_t{std::numeric_limits<int32_t>::max()} + 1;
    REQUIRE_THROWS_AS(cmd.assignGeneratedKey(0, tooBig), std::out_of_range);
}

TEST_CASE("assignGeneratedKey refuses non-key columns and bad indexes", "[command][identity]") {
    ParameterNameGenerator names;
    auto cmd = insertRow(names, "orders", {{"name", std::string("a")}});
    REQUIRE_THROWS_AS(cmd.assignGeneratedKey(1, 5), std::logic_error);
    REQUIRE_THROWS_AS(cmd.assignGeneratedKey(10, 5), std::out_of_range);
}

TEST_CASE("describe names state, table and key", "[command]") {
    ParameterNameGenerator names;
    auto cmd = updateRow(names, "orders", 42, {{"name", std::string("a")}});
    REQUIRE(cmd.describe() == "Modified `orders` {id=42}");

    ModificationCommand scoped("orders", "shop", EntityState::Deleted);
    REQUIRE(scoped.describe() == "Deleted `shop`.`orders` {}");
}
