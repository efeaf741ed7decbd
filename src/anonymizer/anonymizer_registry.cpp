#include "anonymizer/anonymizer_registry.hpp"
#include "anonymizer/builtin_anonymizers.hpp"

#include <format>

namespace sqlanon {

AnonymizerRegistry AnonymizerRegistry::with_builtins() {
    AnonymizerRegistry registry;
    register_builtin_anonymizers(registry);
    return registry;
}

void AnonymizerRegistry::register_factory(std::string name, Factory factory) {
    if (name.empty()) {
        throw UsageError("Anonymizer name must not be empty");
    }
    if (!factory) {
        throw UsageError(std::format("Anonymizer \"{}\" registered without a factory", name));
    }
    if (factories_.contains(name)) {
        throw UsageError(std::format("Anonymizer \"{}\" is already registered", name));
    }
    factories_.emplace(std::move(name), std::move(factory));
}

bool AnonymizerRegistry::has(std::string_view name) const {
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> AnonymizerRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        result.push_back(name);
    }
    return result;
}

std::unique_ptr<AbstractAnonymizer> AnonymizerRegistry::create(
    const TargetConfig& config, const AnonymizerContext& context) const {

    const auto it = factories_.find(config.anonymizer);
    if (it == factories_.end()) {
        throw UnknownAnonymizerKind(config.anonymizer);
    }

    auto anonymizer = it->second(context, config);
    if (!anonymizer) {
        throw StrategyLifecycleError(std::format(
            "Anonymizer \"{}\" factory returned no instance", config.anonymizer));
    }
    if (anonymizer->table_name() != config.table ||
        anonymizer->column_name() != config.target_name) {
        throw StrategyLifecycleError(std::format(
            "Anonymizer \"{}\" bound to \"{}\".\"{}\" instead of \"{}\".\"{}\"",
            config.anonymizer, anonymizer->table_name(), anonymizer->column_name(),
            config.table, config.target_name));
    }
    return anonymizer;
}

} // namespace sqlanon
