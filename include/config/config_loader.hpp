#pragma once

#include "core/database_type.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlanon {

// ============================================================================
// Database Config
// ============================================================================

struct DatabaseConfig {
    std::string name = "default";
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string type_name = "postgresql";   // as written, validated later
    std::string connection_string;
    uint32_t query_timeout_ms = 0;          // 0 = no timeout
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Anonymization Config
// ============================================================================

struct AnonymizationSection {
    std::string file;                       // rules file, resolved against the config file
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    DatabaseConfig database;
    LoggingConfig logging;
    AnonymizationSection anonymization;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sql-anonymizer.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every problem found in @p config, empty if valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    /** @brief "info" | "warn" | "error", case-insensitive */
    [[nodiscard]] static std::optional<utils::log::Level> parse_log_level(const std::string& level);

private:
    static AppConfig extract_all_sections(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static AnonymizationSection extract_anonymization(const toml::table& root);

    static LoadResult validate_and_return(AppConfig config);
};

} // namespace sqlanon
