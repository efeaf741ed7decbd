#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace sqlanon;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "sqlanon_test_include") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

constexpr const char* kMinimalConfig = R"(
[database]
name = "app"
type = "postgresql"
connection_string = "host=localhost dbname=app"

[anonymization]
file = "rules.toml"
)";

} // namespace

// ============================================================================
// Sections
// ============================================================================

TEST_CASE("ConfigLoader: full config", "[config]") {
    const std::string toml = R"(
[database]
name = "shop"
type = "MySQL"
connection_string = "mysql://u:p@db:3307/shop"
query_timeout_ms = 30000

[logging]
level = "warn"

[anonymization]
file = "/etc/sql-anonymizer/rules.toml"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.database.name == "shop");
    CHECK(cfg.database.type == DatabaseType::MYSQL);
    CHECK(cfg.database.connection_string == "mysql://u:p@db:3307/shop");
    CHECK(cfg.database.query_timeout_ms == 30000);
    CHECK(cfg.logging.level == "warn");
    CHECK(cfg.anonymization.file == "/etc/sql-anonymizer/rules.toml");
}

TEST_CASE("ConfigLoader: defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(kMinimalConfig);
    REQUIRE(result.success);
    CHECK(result.config.database.type == DatabaseType::POSTGRESQL);
    CHECK(result.config.database.query_timeout_ms == 0);
    CHECK(result.config.logging.level == "info");
}

TEST_CASE("ConfigLoader: rules file is resolved against the config file", "[config]") {
    TmpDir tmp;
    auto path = tmp.file("main.toml", kMinimalConfig);

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.anonymization.file == (tmp.path / "rules.toml").string());
}

TEST_CASE("ConfigLoader: log levels", "[config]") {
    CHECK(ConfigLoader::parse_log_level("info") == utils::log::Level::INFO);
    CHECK(ConfigLoader::parse_log_level("WARN") == utils::log::Level::WARN);
    CHECK(ConfigLoader::parse_log_level("warning") == utils::log::Level::WARN);
    CHECK(ConfigLoader::parse_log_level("error") == utils::log::Level::ERROR);
    CHECK_FALSE(ConfigLoader::parse_log_level("debug").has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigValidation: empty connection_string fails", "[config][validation]") {
    const std::string toml = R"(
[database]
type = "postgresql"
connection_string = ""

[anonymization]
file = "rules.toml"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("database.connection_string") != std::string::npos);
}

TEST_CASE("ConfigValidation: every error is reported", "[config][validation]") {
    const std::string toml = R"(
[database]
type = "oracle"

[logging]
level = "verbose"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("database.connection_string") != std::string::npos);
    CHECK(result.error_message.find("database.type") != std::string::npos);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
    CHECK(result.error_message.find("anonymization.file") != std::string::npos);
}

TEST_CASE("ConfigValidation: negative timeout fails", "[config][validation]") {
    const std::string toml = R"(
[database]
connection_string = "host=localhost"
query_timeout_ms = -1

[anonymization]
file = "rules.toml"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("query_timeout_ms") != std::string::npos);
}

TEST_CASE("ConfigValidation: syntax error fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[database\n");
    CHECK_FALSE(result.success);
    CHECK_FALSE(result.error_message.empty());
}

// ============================================================================
// Environment variables
// ============================================================================

TEST_CASE("EnvConfig: expand env var in connection_string", "[config][env]") {
    ::setenv("SQLANON_TEST_DB_PASSWORD", "s3cret", 1);

    const std::string toml = R"(
[database]
connection_string = "host=localhost password=${SQLANON_TEST_DB_PASSWORD} dbname=test"

[anonymization]
file = "rules.toml"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string ==
          "host=localhost password=s3cret dbname=test");

    ::unsetenv("SQLANON_TEST_DB_PASSWORD");
}

TEST_CASE("EnvConfig: missing env var expands to empty", "[config][env]") {
    ::unsetenv("NONEXISTENT_VAR_XYZ_12345");

    const std::string toml = R"(
[database]
connection_string = "host=localhost password=${NONEXISTENT_VAR_XYZ_12345} dbname=test"

[anonymization]
file = "rules.toml"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=localhost password= dbname=test");
}

TEST_CASE("EnvConfig: unclosed ${ is parse error", "[config][env]") {
    const std::string toml = R"(
[database]
connection_string = "host=localhost password=${UNCLOSED"

[anonymization]
file = "rules.toml"
)";

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

// ============================================================================
// Includes
// ============================================================================

TEST_CASE("ConfigInclude: included file provides missing sections", "[config][include]") {
    TmpDir tmp;

    tmp.file("database.toml", R"(
[database]
name = "included"
connection_string = "host=db dbname=app"
)");

    auto main_path = tmp.file("main.toml", R"(
include = "database.toml"

[anonymization]
file = "rules.toml"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.database.name == "included");
    CHECK(result.config.database.connection_string == "host=db dbname=app");
}

TEST_CASE("ConfigInclude: main config scalars override included", "[config][include]") {
    TmpDir tmp;

    tmp.file("base.toml", R"(
[database]
name = "base"
connection_string = "host=base"

[logging]
level = "error"
)");

    auto main_path = tmp.file("main.toml", R"(
include = ["base.toml"]

[database]
name = "main"

[anonymization]
file = "rules.toml"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.database.name == "main");
    CHECK(result.config.database.connection_string == "host=base");
    CHECK(result.config.logging.level == "error");
}

TEST_CASE("ConfigInclude: circular include detection", "[config][include]") {
    TmpDir tmp;

    auto a_path = (tmp.path / "a.toml").string();
    auto b_path = (tmp.path / "b.toml").string();

    {
        std::ofstream f(a_path);
        f << "include = \"b.toml\"\n[database]\nconnection_string = \"host=x\"\n";
    }
    {
        std::ofstream f(b_path);
        f << "include = \"a.toml\"\n";
    }

    auto result = ConfigLoader::load_from_file(a_path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("ircular") != std::string::npos);
}

TEST_CASE("ConfigInclude: missing include file reports its path", "[config][include]") {
    TmpDir tmp;

    auto main_path = tmp.file("main.toml", R"(
include = "nonexistent.toml"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("nonexistent.toml") != std::string::npos);
}
