#include "anonymizer/anonymizator.hpp"
#include "anonymizer/plan_builder.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace sqlanon {

Anonymizator::Anonymizator(std::string connection_name,
                           IDbConnection& connection,
                           const ISqlDialect& dialect,
                           ISchemaManager& schema,
                           const AnonymizerRegistry& registry,
                           IAnonymizationConfigLoader& loader)
    : connection_name_(std::move(connection_name)),
      connection_(connection),
      dialect_(dialect),
      schema_(schema),
      registry_(registry),
      loader_(loader) {}

void Anonymizator::load_configuration() {
    config_ = loader_.load();
    utils::log::info(std::format("Connection \"{}\": {} tables configured for anonymization",
        connection_name_, config_->count()));
}

const AnonymizationConfig& Anonymizator::anonymization_config() {
    if (!config_) {
        load_configuration();
    }
    return *config_;
}

size_t Anonymizator::count() {
    return anonymization_config().count();
}

AnonymizationRun Anonymizator::anonymize(
    const std::vector<std::string>& excluded_targets,
    const std::vector<std::string>& only_targets,
    bool at_once) {

    PlanBuilder::check_filters(excluded_targets, only_targets);

    const auto& config = anonymization_config();
    auto plan = PlanBuilder::build(config, excluded_targets, only_targets);

    // Every strategy must resolve before the first table is touched
    for (const auto& entry : plan) {
        for (const auto& target : entry.targets) {
            const auto& kind = config.get(entry.table, target).anonymizer;
            if (!registry_.has(kind)) {
                throw UnknownAnonymizerKind(kind);
            }
        }
    }

    utils::log::info(std::format("Connection \"{}\": {} tables, {} targets planned ({})",
        connection_name_, plan.table_count(), plan.target_count(),
        at_once ? "one update per table" : "one update per target"));

    return AnonymizationRun(context(), registry_, config, std::move(plan), at_once);
}

TempTableSweeper Anonymizator::clean(bool dry_run) {
    return TempTableSweeper(schema_, dry_run, std::string(kTempTablePrefix));
}

std::unique_ptr<AbstractAnonymizer> Anonymizator::create_anonymizer(const TargetConfig& config) {
    return registry_.create(config, context());
}

} // namespace sqlanon
