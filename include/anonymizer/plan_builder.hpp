#pragma once

#include "anonymizer/anonymization_config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlanon {

/**
 * @brief Parsed target filter: "TABLE" (whole table) or "TABLE.TARGET"
 */
struct TargetSelector {
    std::string table;
    std::optional<std::string> target;

    /**
     * @brief Split on the first '.'
     * @throws UsageError on an empty table or target part
     */
    [[nodiscard]] static TargetSelector parse(std::string_view selector);

    [[nodiscard]] bool whole_table() const { return !target.has_value(); }
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Ordered table -> targets work list for one anonymization run
 */
class AnonymizationPlan {
public:
    struct Entry {
        std::string table;
        std::vector<std::string> targets;
    };

    /** @brief Append a target, creating the table entry on first use; duplicates are ignored */
    void add_target(const std::string& table, const std::string& target);

    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t table_count() const { return entries_.size(); }
    [[nodiscard]] size_t target_count() const;

    [[nodiscard]] bool contains(std::string_view table, std::string_view target) const;

    /** @brief Targets planned for @p table, nullptr if the table is not planned */
    [[nodiscard]] const std::vector<std::string>* targets(std::string_view table) const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] const Entry& operator[](size_t index) const { return entries_[index]; }

    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }

private:
    [[nodiscard]] Entry* find(std::string_view table);

    std::vector<Entry> entries_;
};

/**
 * @brief Computes the work list of a run from the configuration and the
 * caller's filters
 *
 * - only_targets given: planned in filter order; "TABLE" selects every
 *   configured target of the table, "TABLE.TARGET" a single one. Naming
 *   something that is not configured is a usage error.
 * - otherwise: configuration order, minus excluded tables and targets.
 */
class PlanBuilder {
public:
    /**
     * @throws UsageError if both filter lists are non-empty, on a malformed
     * selector, or when only_targets names an unconfigured table/target
     */
    [[nodiscard]] static AnonymizationPlan build(
        const AnonymizationConfig& config,
        const std::vector<std::string>& excluded_targets = {},
        const std::vector<std::string>& only_targets = {});

    /**
     * @throws UsageError if both filter lists are non-empty
     */
    static void check_filters(
        const std::vector<std::string>& excluded_targets,
        const std::vector<std::string>& only_targets);

private:
    static AnonymizationPlan build_included(
        const AnonymizationConfig& config, const std::vector<std::string>& only_targets);

    static AnonymizationPlan build_excluded(
        const AnonymizationConfig& config, const std::vector<std::string>& excluded_targets);
};

} // namespace sqlanon
