#pragma once

#include "anonymizer/abstract_anonymizer.hpp"
#include "anonymizer/anonymizer_registry.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlanon::testing {

/**
 * @brief Lifecycle calls of every MockAnonymizer sharing it, in call order:
 * "initialize users.email", "anonymize users.email", "clean users.email"
 */
using EventLog = std::vector<std::string>;

/**
 * @brief Strategy recording its lifecycle and failing on demand
 *
 * Options:
 *   fail_on = "construct" | "initialize" | "anonymize" | "clean"
 *   column  = column to assign (defaults to its own target)
 *
 * anonymize() assigns the literal 'anon' to the column.
 */
class MockAnonymizer : public AbstractAnonymizer {
public:
    MockAnonymizer(const AnonymizerContext& context, const TargetConfig& config, EventLog& log)
        : AbstractAnonymizer(context, config),
          log_(log),
          fail_on_(string_option("fail_on", "")),
          column_(string_option("column", config.target_name)) {
        log_.push_back("construct " + id());
        if (fail_on_ == "construct") {
            throw std::runtime_error("construct failed for " + id());
        }
    }

    void initialize() override { record("initialize"); }

    void anonymize(UpdateQuery& query) override {
        record("anonymize");
        query.set(column_, dialect().quote_literal("anon"));
    }

    void clean() override { record("clean"); }

    /** @brief Register under "mock", logging into @p log */
    static void register_in(AnonymizerRegistry& registry, EventLog& log) {
        registry.register_factory("mock",
            [&log](const AnonymizerContext& context, const TargetConfig& config) {
                return std::make_unique<MockAnonymizer>(context, config, log);
            });
    }

private:
    [[nodiscard]] std::string id() const { return table_name() + "." + column_name(); }

    void record(const std::string& stage) {
        log_.push_back(stage + " " + id());
        if (fail_on_ == stage) {
            throw std::runtime_error(stage + " failed for " + id());
        }
    }

    EventLog& log_;
    std::string fail_on_;
    std::string column_;
};

/**
 * @brief Rule using the "mock" strategy
 */
inline TargetConfig mock_target(std::string table, std::string target,
                                nlohmann::json options = nlohmann::json::object()) {
    return TargetConfig{"mock", std::move(table), std::move(target), std::move(options)};
}

} // namespace sqlanon::testing
