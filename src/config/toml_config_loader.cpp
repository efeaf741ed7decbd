#include "config/toml_config_loader.hpp"
#include "config/toml_utils.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>
#include <vector>

namespace sqlanon {

static constexpr std::string_view kAnonymizerKey = "anonymizer";
static constexpr std::string_view kOptionsKey    = "options";

namespace {

TargetConfig extract_target(const std::string& table, const std::string& target,
                            const toml::node& node) {
    TargetConfig config;
    config.table = table;
    config.target_name = target;

    // Shorthand: target = "strategy"
    if (const auto* kind = node.as_string()) {
        config.anonymizer = kind->get();
        return config;
    }

    const auto* tbl = node.as_table();
    if (!tbl) {
        throw ConfigurationError(std::format(
            "{}.{}: expected a strategy name or a table", table, target));
    }

    for (const auto& [key, value] : *tbl) {
        if (key.str() != kAnonymizerKey && key.str() != kOptionsKey) {
            throw ConfigurationError(std::format(
                "{}.{}: unknown key \"{}\"", table, target, key.str()));
        }
    }

    const auto kind = toml_utils::optional_string(*tbl, kAnonymizerKey);
    if (!kind || kind->empty()) {
        throw ConfigurationError(std::format(
            "{}.{}: \"anonymizer\" is required and must be a non-empty string", table, target));
    }
    config.anonymizer = *kind;

    if (const auto options = (*tbl)[kOptionsKey]; options) {
        const auto* options_tbl = options.as_table();
        if (!options_tbl) {
            throw ConfigurationError(std::format("{}.{}: \"options\" must be a table", table, target));
        }
        config.options = toml_utils::to_json(*options_tbl);
    }
    return config;
}

} // anonymous namespace

TomlAnonymizationConfigLoader TomlAnonymizationConfigLoader::from_file(std::string file_path) {
    return TomlAnonymizationConfigLoader(std::move(file_path), true);
}

TomlAnonymizationConfigLoader TomlAnonymizationConfigLoader::from_string(std::string content) {
    return TomlAnonymizationConfigLoader(std::move(content), false);
}

AnonymizationConfig TomlAnonymizationConfigLoader::extract(const toml::table& root) {
    AnonymizationConfig config;
    extract_into(root, config);
    return config;
}

void TomlAnonymizationConfigLoader::extract_into(const toml::table& root, AnonymizationConfig& config) {
    for (const auto& [table, table_node] : toml_utils::in_source_order(root)) {
        const auto* targets = table_node->as_table();
        if (!targets) {
            throw ConfigurationError(std::format("{}: expected a table of targets", table));
        }
        if (targets->empty()) {
            throw ConfigurationError(std::format("{}: no target configured", table));
        }
        for (const auto& [target, target_node] : toml_utils::in_source_order(*targets)) {
            config.add(extract_target(table, target, *target_node));
        }
    }
}

AnonymizationConfig TomlAnonymizationConfigLoader::load() {
    std::vector<toml_utils::Document> documents;
    try {
        if (is_file_) {
            documents = toml_utils::parse_documents(source_);
        } else {
            documents.push_back(toml_utils::Document{"", toml_utils::parse_string(source_)});
        }
    } catch (const toml::parse_error& e) {
        throw ConfigurationError(std::format("Failed to parse anonymization config{}: {}",
            is_file_ ? " " + source_ : std::string(), e.description()));
    } catch (const std::exception& e) {
        throw ConfigurationError(std::format("Failed to load anonymization config{}: {}",
            is_file_ ? " " + source_ : std::string(), e.what()));
    }

    // Each file is read on its own: included rules first, a target declared twice is an error
    AnonymizationConfig config;
    for (const auto& document : documents) {
        try {
            extract_into(document.table, config);
        } catch (const ConfigurationError& e) {
            if (document.path.empty()) {
                throw;
            }
            throw ConfigurationError(std::format("{}: {}", document.path, e.what()));
        }
    }

    utils::log::info(std::format("Anonymization config loaded: {} tables", config.count()));
    return config;
}

} // namespace sqlanon
