#include <catch2/catch_test_macros.hpp>
#include "anonymizer/anonymizer_registry.hpp"
#include "anonymizer/builtin_anonymizers.hpp"
#include "core/error.hpp"
#include "mocks/mock_db_connection.hpp"
#include "mocks/mock_sql_dialect.hpp"

#include <cstdint>
#include <limits>
#include <string>

using namespace sqlanon;
using namespace sqlanon::testing;

namespace {

struct Fixture {
    MockDbConnection conn;
    MockSqlDialect dialect;
    AnonymizerContext context{conn, dialect};

    std::string contribute(AbstractAnonymizer& anonymizer) {
        UpdateQuery query(dialect, anonymizer.table_name());
        anonymizer.anonymize(query);
        return query.to_sql();
    }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("ConstantAnonymizer: assigns the quoted value", "[builtin][constant]") {
    Fixture f;
    ConstantAnonymizer anonymizer(f.context,
        TargetConfig{"constant", "users", "password", {{"value", "it's secret"}}});

    CHECK(f.contribute(anonymizer) == "UPDATE \"users\" SET \"password\" = 'it''s secret'");
}

TEST_CASE("ConstantAnonymizer: value is required and must be a string", "[builtin][constant]") {
    Fixture f;
    CHECK_THROWS_AS(ConstantAnonymizer(f.context, TargetConfig{"constant", "users", "password"}),
                    ConfigurationError);
    CHECK_THROWS_AS(ConstantAnonymizer(f.context,
                        TargetConfig{"constant", "users", "password", {{"value", 42}}}),
                    ConfigurationError);
}

TEST_CASE("NullAnonymizer: assigns NULL", "[builtin][null]") {
    Fixture f;
    NullAnonymizer anonymizer(f.context, TargetConfig{"null", "users", "last_login_ip"});

    CHECK(f.contribute(anonymizer) == "UPDATE \"users\" SET \"last_login_ip\" = NULL");
}

TEST_CASE("Md5Anonymizer: salted by default", "[builtin][md5]") {
    Fixture f;
    Md5Anonymizer anonymizer(f.context, TargetConfig{"md5", "orders", "note"});

    REQUIRE(anonymizer.salt().size() == 16);
    const auto sql = f.contribute(anonymizer);
    CHECK(sql == "UPDATE \"orders\" SET \"note\" = CASE WHEN \"orders\".\"note\" IS NULL THEN NULL "
                 "ELSE MD5(CONCAT(CAST(\"orders\".\"note\" AS TEXT), '" + anonymizer.salt() + "')) END");
}

TEST_CASE("Md5Anonymizer: unsalted on request", "[builtin][md5]") {
    Fixture f;
    Md5Anonymizer anonymizer(f.context, TargetConfig{"md5", "orders", "note", {{"use_salt", false}}});

    CHECK(anonymizer.salt().empty());
    CHECK(contains(f.contribute(anonymizer), "ELSE MD5(CAST(\"orders\".\"note\" AS TEXT)) END"));
}

TEST_CASE("Md5Anonymizer: salts differ between instances", "[builtin][md5]") {
    Fixture f;
    Md5Anonymizer a(f.context, TargetConfig{"md5", "orders", "note"});
    Md5Anonymizer b(f.context, TargetConfig{"md5", "orders", "note"});
    CHECK(a.salt() != b.salt());
}

TEST_CASE("EmailAnonymizer: builds anon-<hash>@domain", "[builtin][email]") {
    Fixture f;
    EmailAnonymizer anonymizer(f.context,
        TargetConfig{"email", "users", "email", {{"domain", "corp.test"}, {"use_salt", false}}});

    CHECK(f.contribute(anonymizer) ==
          "UPDATE \"users\" SET \"email\" = CASE WHEN \"users\".\"email\" IS NULL THEN NULL "
          "ELSE CONCAT('anon-', MD5(CAST(\"users\".\"email\" AS TEXT)), '@corp.test') END");
}

TEST_CASE("EmailAnonymizer: default domain and domain validation", "[builtin][email]") {
    Fixture f;
    EmailAnonymizer anonymizer(f.context, TargetConfig{"email", "users", "email"});
    CHECK(contains(f.contribute(anonymizer), "'@example.com'"));

    CHECK_THROWS_AS(EmailAnonymizer(f.context,
                        TargetConfig{"email", "users", "email", {{"domain", "a@b"}}}),
                    ConfigurationError);
    CHECK_THROWS_AS(EmailAnonymizer(f.context,
                        TargetConfig{"email", "users", "email", {{"domain", ""}}}),
                    ConfigurationError);
}

TEST_CASE("IntegerAnonymizer: random value in range", "[builtin][integer]") {
    Fixture f;
    IntegerAnonymizer anonymizer(f.context,
        TargetConfig{"integer", "users", "age", {{"min", 18}, {"max", 90}}});

    CHECK(f.contribute(anonymizer) == "UPDATE \"users\" SET \"age\" = RANDOM_INT(18, 90)");
}

TEST_CASE("IntegerAnonymizer: bounds are validated", "[builtin][integer]") {
    Fixture f;
    CHECK_THROWS_AS(IntegerAnonymizer(f.context,
                        TargetConfig{"integer", "users", "age", {{"min", 18}}}),
                    ConfigurationError);
    CHECK_THROWS_AS(IntegerAnonymizer(f.context,
                        TargetConfig{"integer", "users", "age", {{"min", 90}, {"max", 18}}}),
                    ConfigurationError);
    CHECK_THROWS_AS(IntegerAnonymizer(f.context,
                        TargetConfig{"integer", "users", "age", {{"min", "a"}, {"max", 18}}}),
                    ConfigurationError);
}

TEST_CASE("IntegerAnonymizer: range wider than a BIGINT is rejected", "[builtin][integer]") {
    Fixture f;
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

    CHECK_THROWS_AS(IntegerAnonymizer(f.context,
                        TargetConfig{"integer", "users", "age", {{"min", -5}, {"max", kMax}}}),
                    ConfigurationError);
    CHECK_THROWS_AS(IntegerAnonymizer(f.context,
                        TargetConfig{"integer", "users", "age", {{"min", kMin}, {"max", 0}}}),
                    ConfigurationError);

    IntegerAnonymizer widest(f.context,
        TargetConfig{"integer", "users", "age", {{"min", 0}, {"max", kMax - 1}}});
    CHECK(f.contribute(widest) == "UPDATE \"users\" SET \"age\" = RANDOM_INT(0, " +
                                  std::to_string(kMax - 1) + ")");
}

TEST_CASE("StringAnonymizer: temporary sample table lifecycle", "[builtin][string]") {
    Fixture f;
    StringAnonymizer anonymizer(f.context,
        TargetConfig{"string", "users", "name", {{"sample", {"Alice", "O'Brien"}}}});
    CHECK(f.conn.statements().empty());

    anonymizer.initialize();
    const std::string& tmp = anonymizer.temp_table();
    REQUIRE(tmp.starts_with(kTempTablePrefix));
    CHECK(tmp.size() == kTempTablePrefix.size() + 16);

    REQUIRE(f.conn.statements().size() == 2);
    CHECK(f.conn.statements()[0] ==
          "CREATE TABLE \"" + tmp + "\" (\"id\" INTEGER NOT NULL PRIMARY KEY, \"value\" TEXT)");
    CHECK(f.conn.statements()[1] ==
          "INSERT INTO \"" + tmp + "\" (\"id\", \"value\") VALUES (1, 'Alice'), (2, 'O''Brien')");

    const auto sql = f.contribute(anonymizer);
    CHECK(contains(sql, "HASH_BUCKET(\"users\".\"name\", 2) + 1"));
    CHECK(contains(sql, "FROM \"" + tmp + "\""));

    anonymizer.clean();
    REQUIRE(f.conn.statements().size() == 3);
    CHECK(f.conn.statements()[2] == "DROP TABLE \"" + tmp + "\"");

    anonymizer.clean();
    CHECK(f.conn.statements().size() == 3);
}

TEST_CASE("StringAnonymizer: samples are inserted in batches", "[builtin][string]") {
    Fixture f;
    nlohmann::json sample = nlohmann::json::array();
    for (int i = 0; i < 1200; ++i) {
        sample.push_back("v" + std::to_string(i));
    }
    StringAnonymizer anonymizer(f.context, TargetConfig{"string", "users", "name", {{"sample", sample}}});

    anonymizer.initialize();
    CHECK(f.conn.count_containing("INSERT INTO") == 3);
}

TEST_CASE("StringAnonymizer: clean without initialize does nothing", "[builtin][string]") {
    Fixture f;
    StringAnonymizer anonymizer(f.context,
        TargetConfig{"string", "users", "name", {{"sample", {"Alice"}}}});

    anonymizer.clean();
    CHECK(f.conn.statements().empty());

    UpdateQuery query(f.dialect, "users");
    CHECK_THROWS_AS(anonymizer.anonymize(query), StrategyLifecycleError);
}

TEST_CASE("StringAnonymizer: failed CREATE TABLE leaves nothing to clean", "[builtin][string]") {
    Fixture f;
    f.conn.fail_on("CREATE TABLE", "permission denied");
    StringAnonymizer anonymizer(f.context,
        TargetConfig{"string", "users", "name", {{"sample", {"Alice"}}}});

    CHECK_THROWS_AS(anonymizer.initialize(), ExecutionError);
    anonymizer.clean();
    CHECK(f.conn.count_containing("DROP TABLE") == 0);
}

TEST_CASE("StringAnonymizer: sample must be a non-empty string list", "[builtin][string]") {
    Fixture f;
    CHECK_THROWS_AS(StringAnonymizer(f.context, TargetConfig{"string", "users", "name"}),
                    ConfigurationError);
    CHECK_THROWS_AS(StringAnonymizer(f.context,
                        TargetConfig{"string", "users", "name", {{"sample", {1, 2}}}}),
                    ConfigurationError);
}
