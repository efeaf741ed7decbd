#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sqlanon {

/**
 * @brief Anonymization rule for one target (table column)
 */
struct TargetConfig {
    std::string anonymizer;     // registered strategy identifier, e.g. "email"
    std::string table;
    std::string target_name;
    nlohmann::json options = nlohmann::json::object();
};

/**
 * @brief Every anonymization rule of a database, grouped by table
 *
 * Tables and targets keep declaration order. Target names are unique
 * within a table.
 */
class AnonymizationConfig {
public:
    using TargetList = std::vector<std::pair<std::string, std::vector<std::string>>>;

    /**
     * @brief Add a rule
     * @throws ConfigurationError on empty names or a duplicate target
     */
    void add(TargetConfig config);

    /** @brief Number of configured tables */
    [[nodiscard]] size_t count() const { return tables_.size(); }

    [[nodiscard]] bool empty() const { return tables_.empty(); }

    [[nodiscard]] bool has_table(std::string_view table) const;
    [[nodiscard]] bool has_target(std::string_view table, std::string_view target) const;

    /** @brief Target names of @p table in declaration order (empty if unknown) */
    [[nodiscard]] std::vector<std::string> targets_of(std::string_view table) const;

    /** @brief table -> target names, both in declaration order */
    [[nodiscard]] TargetList all_targets() const;

    /**
     * @brief Rules of @p table for @p targets, in the order of @p targets
     * @throws ConfigurationError if the table or one of the targets is unknown
     */
    [[nodiscard]] std::vector<TargetConfig> table_config_targets(
        std::string_view table, const std::vector<std::string>& targets) const;

    /**
     * @throws ConfigurationError if unknown
     */
    [[nodiscard]] const TargetConfig& get(std::string_view table, std::string_view target) const;

private:
    struct TableEntry {
        std::string name;
        std::vector<TargetConfig> targets;
    };

    [[nodiscard]] const TableEntry* find_table(std::string_view table) const;

    std::vector<TableEntry> tables_;
    std::unordered_map<std::string, size_t> table_index_;
};

} // namespace sqlanon
