#include <catch2/catch_test_macros.hpp>

#include <jcailloux/ecluse/update/UpdateSqlGenerator.h>

#include <fixtures/Commands.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace jcailloux::ecluse::update;
using namespace ecluse_test;

// =============================================================================
// INSERT
// =============================================================================

TEST_CASE("bulk insert renders one multi-row statement", "[sql][insert]") {
    UpdateSqlGenerator gen;
    ParameterNameGenerator names;
    auto a = insertRow(names, "orders", {{"name", std::string("a")}, {"qty", std::string("1")}});
    auto b = insertRow(names, "orders", {{"name", std::string("b")}, {"qty", std::string("2")}});
    const ModificationCommand* group[] = {&a, &b};

    std::string sql;
    auto mapping = gen.appendBulkInsertOperation(sql, group, 0);

    REQUIRE(sql == "INSERT INTO `orders` (`name`, `qty`) VALUES (@p0, @p1),\n(@p2, @p3);\n");
    REQUIRE(mapping == ResultSetMapping::NotLastInResultSet);
}

TEST_CASE("insert without written columns uses empty lists", "[sql][insert]") {
    UpdateSqlGenerator gen;
    ParameterNameGenerator names;
    auto a = insertRow(names, "counters", {});

    std::string sql;
    gen.appendInsertOperation(sql, a, 0);
    REQUIRE(sql == "INSERT INTO `counters` () VALUES ();\n");
}

TEST_CASE("schema qualifies the table and backticks are doubled", "[sql]") {
    UpdateSqlGenerator gen;
    ParameterNameGenerator names;
    auto a = insertRow(names, "we`ird", {{"na`me", std::string("a")}}, true, "shop");

    std::string sql;
    gen.appendInsertOperation(sql, a, 0);
    REQUIRE(sql == "INSERT INTO `shop`.`we``ird` (`na``me`) VALUES (@p0);\n");
}

TEST_CASE("insert reading a server default selects the new row back", "[sql][insert][readback]") {
    UpdateSqlGenerator gen;
    ParameterNameGenerator names;
    auto a = insertRow(names, "orders", {{"name", std::string("a")}});
    a.addColumn({.column_name = "created_at", .is_read = true});

    std::string sql;
    auto mapping = gen.appendInsertOperation(sql, a, 0);

    REQUIRE(sql ==
        "INSERT INTO `orders` (`name`) VALUES (@p0);\n"
        "SELECT `id`, `created_at` FROM `orders` WHERE ROW_COUNT() = 1 AND `id` = LAST_INSERT_ID();\n");
    REQUIRE(mapping == ResultSetMapping::LastInResultSet);
}

TEST_CASE("insert with a client key reads back by that key", "[sql][insert][readback]") {
    UpdateSqlGenerator gen;
    ModificationCommand cmd("orders", {}, EntityState::Added);
    cmd.addColumn({.column_name = "code", .is_write = true, .is_key = true,
                   .parameter_name = "p0", .value = std::string("A-1")});
    cmd.addColumn({.column_name = "created_at", .is_read = true});

    std::string sql;
    gen.appendInsertOperation(sql, cmd, 0);

    REQUIRE(sql ==
        "INSERT INTO `orders` (`code`) VALUES (@p0);\n"
        "SELECT `created_at` FROM `orders` WHERE ROW_COUNT() = 1 AND `code` = @p0;\n");
}

TEST_CASE("insert read-back without a key is refused", "[sql][insert][readback]") {
    UpdateSqlGenerator gen;
    ModificationCommand cmd("log", {}, EntityState::Added);
    cmd.addColumn({.column_name = "line", .is_write = true, .parameter_name = "p0",
                   .value = std::string("x")});
    cmd.addColumn({.column_name = "created_at", .is_read = true});

    std::string sql;
    REQUIRE_THROWS_AS(gen.appendInsertOperation(sql, cmd, 0), std::logic_error);
    REQUIRE(sql.empty());
}

TEST_CASE("empty insert group is a logic error", "[sql][insert]") {
    UpdateSqlGenerator gen;
    std::string sql;
    std::vector<const ModificationCommand*> none;
    REQUIRE_THROWS_AS(gen.appendBulkInsertOperation(sql, none, 0), std::logic_error);
}

// =============================================================================
// UPDATE / DELETE
// =============================================================================

TEST_CASE("update renders SET and original value conditions", "[sql][update]") {
    UpdateSqlGenerator gen;
    ParameterNameGenerator names;
    auto cmd = updateRow(names, "orders", 5, {{"name", std::string("x")}});

    std::string sql;
    auto mapping = gen.appendUpdateOperation(sql, cmd, 0);

    REQUIRE(sql == "UPDATE `orders` SET `name` = @p0 WHERE `id` = @p1;\n");
    REQUIRE(mapping == ResultSetMapping::LastInResultSet);
}

TEST_CASE("update with read columns selects the affected row back", "[sql][update]") {
    UpdateSqlGenerator gen;
    ParameterNameGenerator names;
    auto cmd = updateRow(names, "orders", 5, {{"name", std::string("x")}},
                         {{"version", ColumnType::Int32}, {"updated_at", ColumnType::String}});

    std::string sql;
    gen.appendUpdateOperation(sql, cmd, 0);

    REQUIRE(sql ==
        "UPDATE `orders` SET `name` = @p0 WHERE `id` = @p1;\n"
        "SELECT `version`, `updated_at` FROM `orders` WHERE ROW_COUNT() = 1 AND `id` = @p1;\n");
}

TEST_CASE("update of a key column reads back by the new key", "[sql][update][readback]") {
    UpdateSqlGenerator gen;
    ModificationCommand cmd("orders", {}, EntityState::Modified);
    cmd.addColumn({.column_name = "code", .is_write = true, .is_key = true, .is_condition = true,
                   .parameter_name = "p0", .original_parameter_name = "p1",
                   .value = std::string("B-2"), .original_value = std::string("A-1")});
    cmd.addColumn({.column_name = "version", .column_type = ColumnType::Int32, .is_read = true});

    std::string sql;
    gen.appendUpdateOperation(sql, cmd, 0);

    REQUIRE(sql ==
        "UPDATE `orders` SET `code` = @p0 WHERE `code` = @p1;\n"
        "SELECT `version` FROM `orders` WHERE ROW_COUNT() = 1 AND `code` = @p0;\n");
}

TEST_CASE("update read-back without a key is refused", "[sql][update][readback]") {
    UpdateSqlGenerator gen;
    ModificationCommand cmd("log", {}, EntityState::Modified);
    cmd.addColumn({.column_name = "line", .is_write = true, .parameter_name = "p0",
                   .value = std::string("x")});
    cmd.addColumn({.column_name = "seq", .column_type = ColumnType::Int64, .is_condition = true,
                   .original_parameter_name = "p1", .original_value = int64_t{3}});
    cmd.addColumn({.column_name = "updated_at", .is_read = true});

    std::string sql;
    REQUIRE_THROWS_AS(gen.appendUpdateOperation(sql, cmd, 0), std::logic_error);
    REQUIRE(sql.empty());
}

TEST_CASE("null original value becomes IS NULL", "[sql][update]") {
    UpdateSqlGenerator gen;
    ModificationCommand cmd("orders", {}, EntityState::Modified);
    cmd.addColumn({.column_name = "name", .is_write = true, .parameter_name = "p0",
                   .value = std::string("x")});
    cmd.addColumn({.column_name = "id", .column_type = ColumnType::Int64, .is_key = true,
                   .is_condition = true, .original_parameter_name = "p1", .original_value = int64_t{1}});
    cmd.addColumn({.column_name = "deleted_at", .is_condition = true,
                   .original_parameter_name = "p2"});

    std::string sql;
    gen.appendUpdateOperation(sql, cmd, 0);
    REQUIRE(sql == "UPDATE `orders` SET `name` = @p0 WHERE `id` = @p1 AND `deleted_at` IS NULL;\n");
}

TEST_CASE("update without written column or condition is refused", "[sql][update]") {
    UpdateSqlGenerator gen;
    std::string sql;

    ModificationCommand noWrite("orders", {}, EntityState::Modified);
    noWrite.addColumn({.column_name = "id", .is_key = true, .is_condition = true,
                       .original_parameter_name = "p0", .original_value = int64_t{1}});
    REQUIRE_THROWS_AS(gen.appendUpdateOperation(sql, noWrite, 0), std::logic_error);

    ModificationCommand noWhere("orders", {}, EntityState::Modified);
    noWhere.addColumn({.column_name = "name", .is_write = true, .parameter_name = "p0",
                       .value = std::string("x")});
    REQUIRE_THROWS_AS(gen.appendUpdateOperation(sql, noWhere, 0), std::logic_error);
}

TEST_CASE("delete renders key conditions", "[sql][delete]") {
    UpdateSqlGenerator gen;
    ParameterNameGenerator names;
    auto cmd = deleteRow(names, "orders", 9);

    std::string sql;
    auto mapping = gen.appendDeleteOperation(sql, cmd, 0);

    REQUIRE(sql == "DELETE FROM `orders` WHERE `id` = @p0;\n");
    REQUIRE(mapping == ResultSetMapping::LastInResultSet);
}

TEST_CASE("batch header is empty for MySQL", "[sql]") {
    UpdateSqlGenerator gen;
    std::string sql;
    gen.appendBatchHeader(sql);
    REQUIRE(sql.empty());
}
