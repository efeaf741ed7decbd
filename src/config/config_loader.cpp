#include "config/config_loader.hpp"
#include "config/toml_utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace sqlanon {

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extraction ----------------------------------------------------

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* sec = root["database"].as_table();
    if (!sec) return cfg;

    cfg.name = (*sec)["name"].value_or(cfg.name);
    cfg.type_name = (*sec)["type"].value_or(cfg.type_name);
    cfg.connection_string = (*sec)["connection_string"].value_or(std::string{});

    const int64_t timeout = (*sec)["query_timeout_ms"].value_or(int64_t{0});
    if (timeout < 0) {
        throw std::runtime_error(std::format(
            "database.query_timeout_ms must be >= 0, got {}", timeout));
    }
    cfg.query_timeout_ms = static_cast<uint32_t>(timeout);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* sec = root["logging"].as_table();
    if (!sec) return cfg;
    cfg.level = (*sec)["level"].value_or(cfg.level);
    return cfg;
}

AnonymizationSection ConfigLoader::extract_anonymization(const toml::table& root) {
    AnonymizationSection cfg;
    const auto* sec = root["anonymization"].as_table();
    if (!sec) return cfg;
    cfg.file = toml_utils::optional_string(*sec, "file").value_or("");
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.database = extract_database(tbl);
    config.logging = extract_logging(tbl);
    config.anonymization = extract_anonymization(tbl);
    return config;
}

// ---- Shared validation -----------------------------------------------------

std::optional<utils::log::Level> ConfigLoader::parse_log_level(const std::string& level) {
    const std::string lower = utils::to_lower(level);
    if (lower == "info") return utils::log::Level::INFO;
    if (lower == "warn" || lower == "warning") return utils::log::Level::WARN;
    if (lower == "error") return utils::log::Level::ERROR;
    return std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    config.database.type = *parse_database_type(config.database.type_name);
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = toml_utils::parse_file(config_path);
        auto config = extract_all_sections(tbl);

        namespace fs = std::filesystem;
        if (!config.anonymization.file.empty() && fs::path(config.anonymization.file).is_relative()) {
            config.anonymization.file =
                (fs::path(config_path).parent_path() / config.anonymization.file).string();
        }
        return validate_and_return(std::move(config));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to load config: {} ({}:{})",
            e.description(), config_path, e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml_utils::parse_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (config.database.name.empty()) {
        errors.push_back("database.name must not be empty");
    }
    if (config.database.connection_string.empty()) {
        errors.push_back("database.connection_string must not be empty");
    }
    if (!parse_database_type(config.database.type_name)) {
        errors.push_back(std::format(
            "database.type must be one of postgresql, mysql, got \"{}\"", config.database.type_name));
    }

    if (!parse_log_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of info, warn, error, got \"{}\"", config.logging.level));
    }

    if (config.anonymization.file.empty()) {
        errors.push_back("anonymization.file must not be empty");
    }

    return errors;
}

} // namespace sqlanon
