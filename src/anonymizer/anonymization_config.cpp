#include "anonymizer/anonymization_config.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>

namespace sqlanon {

void AnonymizationConfig::add(TargetConfig config) {
    if (config.table.empty()) {
        throw ConfigurationError("Anonymization rule has an empty table name");
    }
    if (config.target_name.empty()) {
        throw ConfigurationError(std::format(
            "Anonymization rule on table \"{}\" has an empty target name", config.table));
    }
    if (config.anonymizer.empty()) {
        throw ConfigurationError(std::format(
            "Target \"{}\".\"{}\" has no anonymizer", config.table, config.target_name));
    }
    if (config.options.is_null()) {
        config.options = nlohmann::json::object();
    }
    if (!config.options.is_object()) {
        throw ConfigurationError(std::format(
            "Target \"{}\".\"{}\": options must be a table", config.table, config.target_name));
    }

    auto [it, inserted] = table_index_.try_emplace(config.table, tables_.size());
    if (inserted) {
        tables_.push_back(TableEntry{config.table, {}});
    }

    auto& entry = tables_[it->second];
    const bool duplicate = std::any_of(entry.targets.begin(), entry.targets.end(),
        [&config](const TargetConfig& existing) {
            return existing.target_name == config.target_name;
        });
    if (duplicate) {
        throw ConfigurationError(std::format(
            "Target \"{}\".\"{}\" is configured twice", config.table, config.target_name));
    }

    entry.targets.push_back(std::move(config));
}

const AnonymizationConfig::TableEntry* AnonymizationConfig::find_table(std::string_view table) const {
    const auto it = table_index_.find(std::string(table));
    return it == table_index_.end() ? nullptr : &tables_[it->second];
}

bool AnonymizationConfig::has_table(std::string_view table) const {
    return find_table(table) != nullptr;
}

bool AnonymizationConfig::has_target(std::string_view table, std::string_view target) const {
    const auto* entry = find_table(table);
    if (!entry) return false;
    return std::any_of(entry->targets.begin(), entry->targets.end(),
        [target](const TargetConfig& t) { return t.target_name == target; });
}

std::vector<std::string> AnonymizationConfig::targets_of(std::string_view table) const {
    std::vector<std::string> names;
    if (const auto* entry = find_table(table)) {
        names.reserve(entry->targets.size());
        for (const auto& target : entry->targets) {
            names.push_back(target.target_name);
        }
    }
    return names;
}

AnonymizationConfig::TargetList AnonymizationConfig::all_targets() const {
    TargetList result;
    result.reserve(tables_.size());
    for (const auto& entry : tables_) {
        result.emplace_back(entry.name, targets_of(entry.name));
    }
    return result;
}

const TargetConfig& AnonymizationConfig::get(std::string_view table, std::string_view target) const {
    const auto* entry = find_table(table);
    if (!entry) {
        throw ConfigurationError(std::format("Table \"{}\" is not configured", table));
    }
    for (const auto& t : entry->targets) {
        if (t.target_name == target) return t;
    }
    throw ConfigurationError(std::format("Target \"{}\".\"{}\" is not configured", table, target));
}

std::vector<TargetConfig> AnonymizationConfig::table_config_targets(
    std::string_view table, const std::vector<std::string>& targets) const {

    std::vector<TargetConfig> result;
    result.reserve(targets.size());
    for (const auto& target : targets) {
        result.push_back(get(table, target));
    }
    return result;
}

} // namespace sqlanon
