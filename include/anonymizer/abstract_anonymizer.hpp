#pragma once

#include "anonymizer/anonymization_config.hpp"
#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "db/isql_dialect.hpp"
#include "db/update_query.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlanon {

/**
 * @brief Name prefix reserved for temporary tables created by anonymizers.
 * TempTableSweeper removes every table carrying it.
 */
inline constexpr std::string_view kTempTablePrefix = "_db_tools_";

/**
 * @brief Collaborators handed to every anonymizer
 */
struct AnonymizerContext {
    IDbConnection& connection;
    const ISqlDialect& dialect;
};

/**
 * @brief Strategy anonymizing one target (table column)
 *
 * Lifecycle, driven by the Anonymizator for the scope of one table:
 *   construct → initialize() → anonymize(query) (once per UPDATE) → clean()
 *
 * Construction must not touch the database; initialize() and clean() may
 * (temporary tables, sample data). Once initialization of the table has
 * started, clean() is called exactly once per instance, even if this
 * instance's initialize() failed or was never reached, so it must tolerate
 * a partially initialized state.
 *
 * In combined mode every anonymizer of a table contributes to the same
 * UpdateQuery: only assign your own column and never assume the WHERE
 * clause is yours.
 */
class AbstractAnonymizer {
public:
    AbstractAnonymizer(const AnonymizerContext& context, const TargetConfig& config);
    virtual ~AbstractAnonymizer() = default;

    AbstractAnonymizer(const AbstractAnonymizer&) = delete;
    AbstractAnonymizer& operator=(const AbstractAnonymizer&) = delete;

    virtual void initialize() {}

    /**
     * @brief Add this target's mutation to @p query
     */
    virtual void anonymize(UpdateQuery& query) = 0;

    virtual void clean() {}

    [[nodiscard]] const std::string& table_name() const { return table_; }
    [[nodiscard]] const std::string& column_name() const { return column_; }
    [[nodiscard]] const std::string& kind() const { return kind_; }
    [[nodiscard]] const nlohmann::json& options() const { return options_; }

protected:
    [[nodiscard]] IDbConnection& connection() { return connection_; }
    [[nodiscard]] const ISqlDialect& dialect() const { return dialect_; }

    /** @brief "_db_tools_" followed by 16 random hex chars */
    [[nodiscard]] static std::string generate_temp_table_name();

    /** @brief @p bytes random bytes, hex encoded (OpenSSL RAND_bytes) */
    [[nodiscard]] static std::string random_hex(size_t bytes);

    // ---- Option accessors (throw ConfigurationError on type mismatch) ------

    [[nodiscard]] bool has_option(std::string_view key) const;
    [[nodiscard]] std::string string_option(std::string_view key, std::string_view default_value) const;
    [[nodiscard]] std::string required_string_option(std::string_view key) const;
    [[nodiscard]] bool bool_option(std::string_view key, bool default_value) const;
    [[nodiscard]] int64_t required_int_option(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> string_list_option(std::string_view key) const;

    /** @brief ConfigurationError prefixed with this target's identity */
    [[nodiscard]] ConfigurationError option_error(std::string_view message) const;

private:
    IDbConnection& connection_;
    const ISqlDialect& dialect_;
    std::string kind_;
    std::string table_;
    std::string column_;
    nlohmann::json options_;
};

} // namespace sqlanon
