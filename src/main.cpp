#include "anonymizer/anonymizator.hpp"
#include "anonymizer/anonymizer_registry.hpp"
#include "config/config_loader.hpp"
#include "config/toml_config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "db/idb_backend.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif
#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_backend.hpp"
#endif

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace sqlanon;

// =========================================================================
// Backends enabled at build time
// =========================================================================

static void register_backends() {
    #ifdef ENABLE_POSTGRESQL
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    #endif

    #ifdef ENABLE_MYSQL
    BackendRegistry::instance().register_backend(
        DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlBackend>(); });
    #endif
}

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string config_file = "config/sql-anonymizer.toml";
    std::string command;
    std::vector<std::string> excluded_targets;
    std::vector<std::string> only_targets;
    bool split_per_column = false;
    bool force = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: sql-anonymizer [-c CONFIG] COMMAND [OPTIONS]\n"
           "\n"
           "Commands:\n"
           "  anonymize   Anonymize the configured tables\n"
           "      --exclude TABLE[.TARGET]   skip a table or a single target (repeatable)\n"
           "      --only TABLE[.TARGET]      process only these (repeatable)\n"
           "      --split-per-column         one UPDATE per target instead of per table\n"
           "  clean       List leftover temporary tables\n"
           "      --force                    drop them\n"
           "  count       Print the number of configured tables\n"
           "\n"
           "Options:\n"
           "  -c, --config FILE   configuration file (default: config/sql-anonymizer.toml)\n"
           "  -h, --help          show this help\n";
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;

    const auto value_of = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError(std::format("Option {} requires a value", flag));
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-c" || arg == "--config") {
            options.config_file = value_of(i, arg);
        } else if (arg == "--exclude") {
            options.excluded_targets.push_back(value_of(i, arg));
        } else if (arg == "--only") {
            options.only_targets.push_back(value_of(i, arg));
        } else if (arg == "--split-per-column") {
            options.split_per_column = true;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg.starts_with("-")) {
            throw UsageError(std::format("Unknown option: {}", arg));
        } else if (options.command.empty()) {
            options.command = std::string(arg);
        } else {
            throw UsageError(std::format("Unexpected argument: {}", arg));
        }
    }

    if (options.help) {
        return options;
    }
    if (options.command.empty()) {
        throw UsageError("Missing command");
    }
    if (options.command != "anonymize" && options.command != "clean" && options.command != "count") {
        throw UsageError(std::format("Unknown command: {}", options.command));
    }

    const bool anonymize = options.command == "anonymize";
    if (!anonymize && (!options.excluded_targets.empty() || !options.only_targets.empty() ||
                       options.split_per_column)) {
        throw UsageError("--exclude, --only and --split-per-column only apply to anonymize");
    }
    if (options.force && options.command != "clean") {
        throw UsageError("--force only applies to clean");
    }
    return options;
}

int run(const CliOptions& options) {
    utils::log::info(std::format("Loading configuration from {}", options.config_file));

    const auto config_result = ConfigLoader::load_from_file(options.config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return kExitError;
    }
    const auto& cfg = config_result.config;

    if (const auto level = ConfigLoader::parse_log_level(cfg.logging.level)) {
        utils::log::set_level(*level);
    }

    auto loader = TomlAnonymizationConfigLoader::from_file(cfg.anonymization.file);
    const auto registry = AnonymizerRegistry::with_builtins();

    // count needs no database
    if (options.command == "count") {
        std::cout << loader.load().count() << '\n';
        return kExitOk;
    }

    register_backends();
    auto backend = BackendRegistry::instance().create(cfg.database.type);
    auto connection = backend->create_connection(cfg.database.connection_string);
    if (!connection) {
        utils::log::error(std::format("Cannot connect to database \"{}\"", cfg.database.name));
        return kExitError;
    }
    if (cfg.database.query_timeout_ms > 0 && !connection->set_query_timeout(cfg.database.query_timeout_ms)) {
        utils::log::warn(std::format("Could not set query timeout to {} ms", cfg.database.query_timeout_ms));
    }

    const auto dialect = backend->dialect();
    auto schema = backend->create_schema_manager(*connection);

    Anonymizator anonymizator(cfg.database.name, *connection, *dialect, *schema, registry, loader);

    if (options.command == "clean") {
        if (!options.force) {
            utils::log::info("Dry run: nothing will be dropped, use --force to drop");
        }
        for (const auto& line : anonymizator.clean(!options.force)) {
            std::cout << line << std::endl;
        }
        return kExitOk;
    }

    utils::Timer timer;
    auto run = anonymizator.anonymize(
        options.excluded_targets, options.only_targets, !options.split_per_column);
    for (const auto& line : run) {
        std::cout << line << std::endl;
    }
    utils::log::info(std::format("Anonymization of \"{}\" done, {}",
        anonymizator.connection_name(), timer.summary()));
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto options = parse_args(argc, argv);
        if (options.help) {
            print_usage(std::cout);
            return kExitOk;
        }
        return run(options);
    } catch (const UsageError& e) {
        utils::log::error(e.what());
        print_usage(std::cerr);
        return kExitUsage;
    } catch (const AnonymizerError& e) {
        utils::log::error(std::format("{} error: {}", error_category_to_string(e.category()), e.what()));
        return kExitError;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitError;
    }
}
