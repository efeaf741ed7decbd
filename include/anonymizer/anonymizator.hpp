#pragma once

#include "anonymizer/abstract_anonymizer.hpp"
#include "anonymizer/anonymization_config.hpp"
#include "anonymizer/anonymization_run.hpp"
#include "anonymizer/anonymizer_registry.hpp"
#include "anonymizer/iconfig_loader.hpp"
#include "anonymizer/temp_table_sweeper.hpp"
#include "db/idb_connection.hpp"
#include "db/ischema_manager.hpp"
#include "db/isql_dialect.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlanon {

/**
 * @brief Anonymizes one database connection
 *
 * Entry point tying the rules (loaded lazily through the config loader,
 * then cached), the strategy registry and the connection together.
 * Collaborators are borrowed and must outlive the Anonymizator; so must the
 * runs and sweepers it hands out.
 *
 * Usage:
 *   Anonymizator anonymizator("default", conn, dialect, schema, registry, loader);
 *   for (const auto& line : anonymizator.anonymize()) {
 *       std::cout << line << '\n';
 *   }
 */
class Anonymizator {
public:
    Anonymizator(std::string connection_name,
                 IDbConnection& connection,
                 const ISqlDialect& dialect,
                 ISchemaManager& schema,
                 const AnonymizerRegistry& registry,
                 IAnonymizationConfigLoader& loader);

    Anonymizator(const Anonymizator&) = delete;
    Anonymizator& operator=(const Anonymizator&) = delete;

    /**
     * @brief (Re)load the rules from the loader
     * @throws ConfigurationError
     */
    void load_configuration();

    /** @brief Cached rules, loaded on first access */
    [[nodiscard]] const AnonymizationConfig& anonymization_config();

    /** @brief Number of configured tables */
    [[nodiscard]] size_t count();

    /**
     * @brief Plan the run and return its lazy progress stream
     *
     * Filters are validated and the plan built before returning; no
     * database work happens until the stream is pulled.
     *
     * @param excluded_targets "TABLE" or "TABLE.TARGET" selectors to skip
     * @param only_targets     "TABLE" or "TABLE.TARGET" selectors to run, in order
     * @param at_once          one UPDATE per table (true) or per target (false)
     * @throws UsageError      both filter lists given, malformed or unknown selector
     * @throws ConfigurationError if the rules cannot be loaded
     */
    [[nodiscard]] AnonymizationRun anonymize(
        const std::vector<std::string>& excluded_targets = {},
        const std::vector<std::string>& only_targets = {},
        bool at_once = true);

    /**
     * @brief Lazy stream listing (and unless dry_run, dropping) leftover
     * temporary tables
     */
    [[nodiscard]] TempTableSweeper clean(bool dry_run = true);

    /**
     * @brief Strategy instance for one target, bound to this connection
     */
    [[nodiscard]] std::unique_ptr<AbstractAnonymizer> create_anonymizer(const TargetConfig& config);

    [[nodiscard]] const std::string& connection_name() const { return connection_name_; }
    [[nodiscard]] IDbConnection& connection() { return connection_; }
    [[nodiscard]] const ISqlDialect& dialect() const { return dialect_; }

private:
    [[nodiscard]] AnonymizerContext context() { return AnonymizerContext{connection_, dialect_}; }

    std::string connection_name_;
    IDbConnection& connection_;
    const ISqlDialect& dialect_;
    ISchemaManager& schema_;
    const AnonymizerRegistry& registry_;
    IAnonymizationConfigLoader& loader_;
    std::optional<AnonymizationConfig> config_;
};

} // namespace sqlanon
