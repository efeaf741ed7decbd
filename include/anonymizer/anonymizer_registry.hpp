#pragma once

#include "anonymizer/abstract_anonymizer.hpp"

#include <concepts>
#include <functional>
#include <type_traits>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlanon {

/**
 * @brief Compile-time strategy contract checked by register_anonymizer<T>()
 */
template<typename T>
concept AnonymizerImplementation =
    std::derived_from<T, AbstractAnonymizer> &&
    !std::is_abstract_v<T> &&
    std::constructible_from<T, const AnonymizerContext&, const TargetConfig&>;

/**
 * @brief Registry of anonymization strategies, keyed by identifier
 *
 * Resolves the "anonymizer" field of a TargetConfig to a strategy
 * instance. Invalid registrations are rejected when registered, not when
 * first used.
 *
 * Usage:
 *   AnonymizerRegistry registry;
 *   registry.register_anonymizer<EmailAnonymizer>("email");
 *   auto anonymizer = registry.create(target_config, context);
 */
class AnonymizerRegistry {
public:
    using Factory = std::function<std::unique_ptr<AbstractAnonymizer>(
        const AnonymizerContext&, const TargetConfig&)>;

    /** @brief Registry preloaded with the built-in strategies */
    [[nodiscard]] static AnonymizerRegistry with_builtins();

    template<AnonymizerImplementation T>
    void register_anonymizer(std::string name) {
        register_factory(std::move(name),
            [](const AnonymizerContext& context, const TargetConfig& config) {
                return std::make_unique<T>(context, config);
            });
    }

    /**
     * @throws UsageError on an empty name, an empty factory or a name
     * that is already registered
     */
    void register_factory(std::string name, Factory factory);

    [[nodiscard]] bool has(std::string_view name) const;

    /** @brief Registered identifiers, sorted */
    [[nodiscard]] std::vector<std::string> names() const;

    /**
     * @brief Instantiate the strategy configured for a target
     * @throws UnknownAnonymizerKind if not registered
     * @throws StrategyLifecycleError if the factory returns null or an
     * instance bound to another target
     * @throws ConfigurationError if the strategy rejects its options
     */
    [[nodiscard]] std::unique_ptr<AbstractAnonymizer> create(
        const TargetConfig& config, const AnonymizerContext& context) const;

private:
    std::map<std::string, Factory, std::less<>> factories_;
};

} // namespace sqlanon
