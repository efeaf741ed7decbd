#include <catch2/catch_test_macros.hpp>
#include "anonymizer/abstract_anonymizer.hpp"
#include "anonymizer/temp_table_sweeper.hpp"
#include "core/error.hpp"
#include "mocks/mock_schema_manager.hpp"

#include <string>
#include <vector>

using namespace sqlanon;
using namespace sqlanon::testing;

namespace {

TempTableSweeper make_sweeper(MockSchemaManager& schema, bool dry_run) {
    return TempTableSweeper(schema, dry_run, std::string(kTempTablePrefix));
}

} // namespace

TEST_CASE("TempTableSweeper: dry run lists matches only", "[sweeper]") {
    MockSchemaManager schema({"_db_tools_1", "users", "_db_tools_2"});
    auto sweeper = make_sweeper(schema, true);

    std::vector<std::string> lines;
    for (const auto& line : sweeper) {
        lines.push_back(line);
    }

    CHECK(lines == std::vector<std::string>{"table: _db_tools_1", "table: _db_tools_2"});
    CHECK(schema.dropped().empty());
    CHECK(sweeper.matched() == 2);
}

TEST_CASE("TempTableSweeper: drops each table on the following pull", "[sweeper]") {
    MockSchemaManager schema({"_db_tools_1", "users", "_db_tools_2"});
    auto sweeper = make_sweeper(schema, false);

    CHECK(*sweeper.next() == "table: _db_tools_1");
    CHECK(schema.dropped().empty());

    CHECK(*sweeper.next() == "table: _db_tools_2");
    CHECK(schema.dropped() == std::vector<std::string>{"_db_tools_1"});

    CHECK_FALSE(sweeper.next().has_value());
    CHECK(schema.dropped() == std::vector<std::string>{"_db_tools_1", "_db_tools_2"});
    CHECK(schema.tables() == std::vector<std::string>{"users"});
}

TEST_CASE("TempTableSweeper: tables are listed lazily, once", "[sweeper]") {
    MockSchemaManager schema({"_db_tools_1"});
    auto sweeper = make_sweeper(schema, true);

    CHECK(schema.list_count() == 0);
    (void)sweeper.next();
    (void)sweeper.next();
    (void)sweeper.next();
    CHECK(schema.list_count() == 1);
}

TEST_CASE("TempTableSweeper: non-matching tables are never touched", "[sweeper]") {
    MockSchemaManager schema({"users", "orders", "db_tools_x", "x_db_tools_"});
    auto sweeper = make_sweeper(schema, false);

    CHECK_FALSE(sweeper.next().has_value());
    CHECK(schema.dropped().empty());
    CHECK(sweeper.matched() == 0);
}

TEST_CASE("TempTableSweeper: drop failure ends the stream", "[sweeper][failure]") {
    MockSchemaManager schema({"_db_tools_1", "_db_tools_2"});
    schema.fail_drop_of("_db_tools_1");
    auto sweeper = make_sweeper(schema, false);

    CHECK(*sweeper.next() == "table: _db_tools_1");
    CHECK_THROWS_AS(sweeper.next(), ExecutionError);
    CHECK_FALSE(sweeper.next().has_value());
    CHECK(schema.dropped().empty());
}

TEST_CASE("TempTableSweeper: listing failure ends the stream", "[sweeper][failure]") {
    MockSchemaManager schema({"_db_tools_1"});
    schema.fail_listing();
    auto sweeper = make_sweeper(schema, true);

    CHECK_THROWS_AS(sweeper.next(), ExecutionError);
    CHECK_FALSE(sweeper.next().has_value());
}

TEST_CASE("TempTableSweeper: custom prefix", "[sweeper]") {
    MockSchemaManager schema({"tmp_a", "_db_tools_1"});
    TempTableSweeper sweeper(schema, true, "tmp_");

    CHECK(*sweeper.next() == "table: tmp_a");
    CHECK_FALSE(sweeper.next().has_value());
}
