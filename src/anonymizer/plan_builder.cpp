#include "anonymizer/plan_builder.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <unordered_set>

namespace sqlanon {

static constexpr char kSelectorSeparator = '.';

// ============================================================================
// TargetSelector
// ============================================================================

TargetSelector TargetSelector::parse(std::string_view selector) {
    TargetSelector result;

    const size_t dot = selector.find(kSelectorSeparator);
    if (dot == std::string_view::npos) {
        result.table = std::string(selector);
    } else {
        result.table = std::string(selector.substr(0, dot));
        result.target = std::string(selector.substr(dot + 1));
    }

    if (result.table.empty() || (result.target && result.target->empty())) {
        throw UsageError(std::format(
            "Malformed target \"{}\": expected \"TABLE\" or \"TABLE.TARGET\"", selector));
    }
    return result;
}

std::string TargetSelector::to_string() const {
    return target ? table + kSelectorSeparator + *target : table;
}

// ============================================================================
// AnonymizationPlan
// ============================================================================

AnonymizationPlan::Entry* AnonymizationPlan::find(std::string_view table) {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
        [table](const Entry& e) { return e.table == table; });
    return it == entries_.end() ? nullptr : &*it;
}

void AnonymizationPlan::add_target(const std::string& table, const std::string& target) {
    Entry* entry = find(table);
    if (!entry) {
        entries_.push_back(Entry{table, {}});
        entry = &entries_.back();
    }
    if (std::find(entry->targets.begin(), entry->targets.end(), target) == entry->targets.end()) {
        entry->targets.push_back(target);
    }
}

size_t AnonymizationPlan::target_count() const {
    size_t total = 0;
    for (const auto& entry : entries_) {
        total += entry.targets.size();
    }
    return total;
}

const std::vector<std::string>* AnonymizationPlan::targets(std::string_view table) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
        [table](const Entry& e) { return e.table == table; });
    return it == entries_.end() ? nullptr : &it->targets;
}

bool AnonymizationPlan::contains(std::string_view table, std::string_view target) const {
    const auto* list = targets(table);
    return list && std::find(list->begin(), list->end(), target) != list->end();
}

// ============================================================================
// PlanBuilder
// ============================================================================

void PlanBuilder::check_filters(
    const std::vector<std::string>& excluded_targets,
    const std::vector<std::string>& only_targets) {

    if (!excluded_targets.empty() && !only_targets.empty()) {
        throw UsageError("Excluded targets and only targets are mutually exclusive");
    }
}

AnonymizationPlan PlanBuilder::build(
    const AnonymizationConfig& config,
    const std::vector<std::string>& excluded_targets,
    const std::vector<std::string>& only_targets) {

    check_filters(excluded_targets, only_targets);

    if (!only_targets.empty()) {
        return build_included(config, only_targets);
    }
    return build_excluded(config, excluded_targets);
}

AnonymizationPlan PlanBuilder::build_included(
    const AnonymizationConfig& config, const std::vector<std::string>& only_targets) {

    // First pass keeps filter order; a whole-table selector is recorded as
    // "every target" (nullopt) and expanded against the configuration below.
    struct Pending {
        std::string table;
        std::optional<std::vector<std::string>> targets;
    };
    std::vector<Pending> pending;

    for (const auto& raw : only_targets) {
        auto selector = TargetSelector::parse(raw);

        if (!config.has_table(selector.table)) {
            throw UsageError(std::format("Table \"{}\" has no anonymization rule", selector.table));
        }
        if (selector.target && !config.has_target(selector.table, *selector.target)) {
            throw UsageError(std::format(
                "Target \"{}\" has no anonymization rule", selector.to_string()));
        }

        auto it = std::find_if(pending.begin(), pending.end(),
            [&selector](const Pending& p) { return p.table == selector.table; });
        if (it == pending.end()) {
            pending.push_back(Pending{selector.table, std::vector<std::string>{}});
            it = std::prev(pending.end());
        }

        if (selector.whole_table()) {
            it->targets.reset();
        } else if (it->targets) {
            it->targets->push_back(*selector.target);
        }
    }

    AnonymizationPlan plan;
    for (const auto& p : pending) {
        const auto targets = p.targets ? *p.targets : config.targets_of(p.table);
        for (const auto& target : targets) {
            plan.add_target(p.table, target);
        }
    }
    return plan;
}

AnonymizationPlan PlanBuilder::build_excluded(
    const AnonymizationConfig& config, const std::vector<std::string>& excluded_targets) {

    std::unordered_set<std::string> excluded;
    for (const auto& raw : excluded_targets) {
        excluded.insert(TargetSelector::parse(raw).to_string());
    }

    AnonymizationPlan plan;
    for (const auto& [table, targets] : config.all_targets()) {
        if (excluded.contains(table)) {
            continue;
        }
        for (const auto& target : targets) {
            if (excluded.contains(table + kSelectorSeparator + target)) {
                continue;
            }
            plan.add_target(table, target);
        }
    }
    return plan;
}

} // namespace sqlanon
