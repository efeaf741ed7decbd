#include <catch2/catch_test_macros.hpp>

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_dialect.hpp"
#endif
#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_dialect.hpp"
#endif

using namespace sqlanon;

#ifdef ENABLE_POSTGRESQL

TEST_CASE("PgDialect: quoting", "[dialect][postgresql]") {
    PgDialect dialect;
    CHECK(dialect.type() == DatabaseType::POSTGRESQL);
    CHECK(dialect.quote_identifier("users") == "\"users\"");
    CHECK(dialect.quote_identifier("we\"ird") == "\"we\"\"ird\"");
    CHECK(dialect.quote_literal("O'Brien") == "'O''Brien'");
    CHECK(dialect.quote_literal("C:\\tmp") == "'C:\\tmp'");
}

TEST_CASE("PgDialect: expressions", "[dialect][postgresql]") {
    PgDialect dialect;
    CHECK(dialect.cast_to_text("\"t\".\"c\"") == "CAST(\"t\".\"c\" AS TEXT)");
    CHECK(dialect.random_int(18, 90) == "FLOOR(RANDOM() * 73 + 18)::BIGINT");
    CHECK(dialect.random_int(-5, 5) == "FLOOR(RANDOM() * 11 + -5)::BIGINT");
    CHECK(dialect.hash_bucket("x", 5) ==
          "MOD(ABS(HASHTEXT(COALESCE(CAST(x AS TEXT), ''))::BIGINT), 5)");
    CHECK(dialect.list_tables_query().find("current_schema()") != std::string::npos);
}

#endif

#ifdef ENABLE_MYSQL

TEST_CASE("MysqlDialect: quoting", "[dialect][mysql]") {
    MysqlDialect dialect;
    CHECK(dialect.type() == DatabaseType::MYSQL);
    CHECK(dialect.quote_identifier("users") == "`users`");
    CHECK(dialect.quote_identifier("we`ird") == "`we``ird`");
    CHECK(dialect.quote_literal("O'Brien") == "'O''Brien'");
    CHECK(dialect.quote_literal("C:\\tmp") == "'C:\\\\tmp'");
}

TEST_CASE("MysqlDialect: expressions", "[dialect][mysql]") {
    MysqlDialect dialect;
    CHECK(dialect.cast_to_text("c") == "CAST(c AS CHAR)");
    CHECK(dialect.random_int(1, 10) == "FLOOR(RAND() * 10 + 1)");
    CHECK(dialect.hash_bucket("c", 3) == "MOD(CRC32(COALESCE(CAST(c AS CHAR), '')), 3)");
    CHECK(dialect.list_tables_query().find("DATABASE()") != std::string::npos);
}

TEST_CASE("MysqlConnection: parse connection string", "[dialect][mysql]") {
    const auto params = MysqlConnection::parse_connection_string("mysql://app:p@ss@db.local:3307/shop");
    CHECK(params.user == "app");
    CHECK(params.password == "p@ss");
    CHECK(params.host == "db.local");
    CHECK(params.port == 3307);
    CHECK(params.database == "shop");
}

TEST_CASE("MysqlConnection: connection string defaults", "[dialect][mysql]") {
    const auto params = MysqlConnection::parse_connection_string("mariadb://root@/test");
    CHECK(params.user == "root");
    CHECK(params.password.empty());
    CHECK(params.host == "localhost");
    CHECK(params.port == 3306);
    CHECK(params.database == "test");
}

#endif
