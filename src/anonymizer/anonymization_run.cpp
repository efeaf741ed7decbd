#include "anonymizer/anonymization_run.hpp"
#include "anonymizer/anonymizer_registry.hpp"
#include "core/error.hpp"
#include "db/update_query.hpp"

#include <exception>
#include <format>
#include <string_view>
#include <utility>

namespace sqlanon {

namespace {

std::string describe(const AbstractAnonymizer& anonymizer) {
    return std::format("Anonymizer \"{}\" on \"{}\".\"{}\"",
        anonymizer.kind(), anonymizer.table_name(), anonymizer.column_name());
}

// Classified errors pass through, anything else becomes a lifecycle error
template<typename Fn>
void call_hook(const AbstractAnonymizer& anonymizer, std::string_view stage, Fn&& fn) {
    try {
        fn();
    } catch (const AnonymizerError&) {
        throw;
    } catch (const std::exception& e) {
        throw StrategyLifecycleError(std::format("{} failed to {}: {}",
            describe(anonymizer), stage, e.what()));
    }
}

std::string quoted_list(const std::vector<std::string>& names) {
    std::vector<std::string> quoted;
    quoted.reserve(names.size());
    for (const auto& name : names) {
        quoted.push_back("\"" + name + "\"");
    }
    return utils::join(quoted, ", ");
}

} // anonymous namespace

// ============================================================================
// TableScope
// ============================================================================

TableScope::TableScope(std::string table, std::vector<std::unique_ptr<AbstractAnonymizer>> anonymizers)
    : table_(std::move(table)),
      anonymizers_(std::move(anonymizers)) {}

TableScope::~TableScope() {
    if (!initialized_ || cleaned_) {
        return;
    }
    for (const auto& failure : clean_all()) {
        utils::log::warn(std::format("Abandoned table \"{}\": {}", table_, failure));
    }
}

void TableScope::initialize_all() {
    initialized_ = true;
    for (auto& anonymizer : anonymizers_) {
        call_hook(*anonymizer, "initialize", [&] { anonymizer->initialize(); });
    }
}

std::vector<std::string> TableScope::clean_all() {
    cleaned_ = true;
    std::vector<std::string> failures;
    for (auto& anonymizer : anonymizers_) {
        try {
            anonymizer->clean();
        } catch (const std::exception& e) {
            failures.push_back(std::format("{} failed to clean: {}", describe(*anonymizer), e.what()));
        }
    }
    return failures;
}

// ============================================================================
// AnonymizationRun
// ============================================================================

AnonymizationRun::AnonymizationRun(const AnonymizerContext& context,
                                   const AnonymizerRegistry& registry,
                                   const AnonymizationConfig& config,
                                   AnonymizationPlan plan,
                                   bool at_once)
    : context_(context),
      registry_(registry),
      config_(config),
      plan_(std::move(plan)),
      at_once_(at_once) {
    if (plan_.empty()) {
        step_ = Step::DONE;
    }
}

std::optional<std::string> AnonymizationRun::next() {
    switch (step_) {
        case Step::TABLE_HEADER:
            return start_table();

        case Step::INIT_MARKER:
            step_ = Step::INITIALIZE;
            return "   - initializing anonymizers...";

        case Step::INITIALIZE:
            return initialize_table();

        case Step::ANONYMIZE_MARKER:
            step_ = Step::ANONYMIZE_TABLE;
            return "   - anonymizing...";

        case Step::ANONYMIZE_TABLE:
            return anonymize_table();

        case Step::COLUMN_HEADER: {
            step_timer_.reset();
            const auto& anonymizer = (*scope_)[column_index_];
            step_ = Step::ANONYMIZE_COLUMN;
            return std::format("   - anonymizing {}/{}: \"{}\".\"{}\"...",
                column_index_ + 1, scope_->size(), anonymizer.table_name(), anonymizer.column_name());
        }

        case Step::ANONYMIZE_COLUMN:
            return anonymize_column();

        case Step::CLEAN_MARKER:
            step_timer_.reset();
            step_ = Step::CLEAN;
            return "   - cleaning anonymizers...";

        case Step::CLEAN:
            return clean_table();

        case Step::TOTAL:
            return finish_table();

        case Step::FAILED: {
            step_ = Step::DONE;
            auto error = std::exchange(pending_error_, nullptr);
            std::rethrow_exception(error);
        }

        case Step::DONE:
            break;
    }
    return std::nullopt;
}

std::unique_ptr<TableScope> AnonymizationRun::create_scope(const AnonymizationPlan::Entry& entry) {
    std::vector<std::unique_ptr<AbstractAnonymizer>> anonymizers;
    anonymizers.reserve(entry.targets.size());
    for (const auto& target : config_.table_config_targets(entry.table, entry.targets)) {
        try {
            anonymizers.push_back(registry_.create(target, context_));
        } catch (const AnonymizerError&) {
            throw;
        } catch (const std::exception& e) {
            throw StrategyLifecycleError(std::format(
                "Anonymizer \"{}\" on \"{}\".\"{}\" failed to construct: {}",
                target.anonymizer, target.table, target.target_name, e.what()));
        }
    }
    return std::make_unique<TableScope>(entry.table, std::move(anonymizers));
}

std::optional<std::string> AnonymizationRun::start_table() {
    const auto& entry = plan_[table_index_];
    table_timer_.reset();

    // Nothing has touched the database yet: no cleanup owed on failure
    try {
        scope_ = create_scope(entry);
    } catch (const std::exception&) {
        step_ = Step::DONE;
        throw;
    }

    column_index_ = 0;
    step_ = Step::INIT_MARKER;
    return std::format(" * table {}/{}: \"{}\" ({})",
        table_index_ + 1, plan_.table_count(), entry.table, quoted_list(entry.targets));
}

std::optional<std::string> AnonymizationRun::initialize_table() {
    try {
        scope_->initialize_all();
    } catch (const std::exception&) {
        pending_error_ = std::current_exception();
        step_ = Step::CLEAN_MARKER;
        return next();
    }

    step_ = at_once_ ? Step::ANONYMIZE_MARKER : Step::COLUMN_HEADER;
    return table_timer_.summary();
}

std::optional<std::string> AnonymizationRun::anonymize_table() {
    step_timer_.reset();

    std::vector<AbstractAnonymizer*> all;
    all.reserve(scope_->size());
    for (size_t i = 0; i < scope_->size(); ++i) {
        all.push_back(&(*scope_)[i]);
    }

    try {
        run_update(all);
    } catch (const std::exception&) {
        pending_error_ = std::current_exception();
        step_ = Step::CLEAN_MARKER;
        return next();
    }

    step_ = Step::CLEAN_MARKER;
    return step_timer_.summary();
}

std::optional<std::string> AnonymizationRun::anonymize_column() {
    try {
        run_update({&(*scope_)[column_index_]});
    } catch (const std::exception&) {
        pending_error_ = std::current_exception();
        step_ = Step::CLEAN_MARKER;
        return next();
    }

    ++column_index_;
    step_ = column_index_ < scope_->size() ? Step::COLUMN_HEADER : Step::CLEAN_MARKER;
    return step_timer_.summary();
}

void AnonymizationRun::run_update(const std::vector<AbstractAnonymizer*>& anonymizers) {
    UpdateQuery query(context_.dialect, scope_->table());
    for (auto* anonymizer : anonymizers) {
        call_hook(*anonymizer, "anonymize", [&] { anonymizer->anonymize(query); });
    }

    if (!query.has_assignments()) {
        utils::log::warn(std::format("Table \"{}\": nothing to update", scope_->table()));
        return;
    }

    const auto result = execute_or_throw(context_.connection, query.to_sql());
    utils::log::info(std::format("Table \"{}\": {} rows updated", scope_->table(), result.affected_rows));
}

std::optional<std::string> AnonymizationRun::clean_table() {
    const auto failures = scope_->clean_all();

    if (!failures.empty()) {
        if (pending_error_) {
            for (const auto& failure : failures) {
                utils::log::error(failure);
            }
        } else {
            pending_error_ = std::make_exception_ptr(StrategyLifecycleError(std::format(
                "Cleaning anonymizers of table \"{}\" failed: {}",
                scope_->table(), utils::join(failures, "; "))));
        }
    }

    step_ = Step::TOTAL;
    return step_timer_.summary();
}

std::optional<std::string> AnonymizationRun::finish_table() {
    std::string line = "   - total " + table_timer_.summary();
    scope_.reset();

    if (pending_error_) {
        step_ = Step::FAILED;
    } else if (++table_index_ < plan_.table_count()) {
        step_ = Step::TABLE_HEADER;
    } else {
        step_ = Step::DONE;
    }
    return line;
}

} // namespace sqlanon
