#pragma once

#include "anonymizer/anonymization_config.hpp"

#include <utility>

namespace sqlanon {

/**
 * @brief Source of anonymization rules
 *
 * Called once per Anonymizator, lazily, on first use.
 */
class IAnonymizationConfigLoader {
public:
    virtual ~IAnonymizationConfigLoader() = default;

    /**
     * @brief Load every rule
     * @throws ConfigurationError on format or validation failure
     */
    [[nodiscard]] virtual AnonymizationConfig load() = 0;
};

/**
 * @brief Loader returning a configuration built in code
 */
class InMemoryConfigLoader : public IAnonymizationConfigLoader {
public:
    explicit InMemoryConfigLoader(AnonymizationConfig config)
        : config_(std::move(config)) {}

    [[nodiscard]] AnonymizationConfig load() override {
        ++load_count_;
        return config_;
    }

    [[nodiscard]] size_t load_count() const { return load_count_; }

private:
    AnonymizationConfig config_;
    size_t load_count_ = 0;
};

} // namespace sqlanon
