#pragma once

#include "db/isql_dialect.hpp"

namespace sqlanon {

/**
 * @brief MySQL / MariaDB dialect
 *
 * Literal escaping covers the default sql_mode, where backslash is an
 * escape character inside string literals.
 */
class MysqlDialect : public ISqlDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::MYSQL; }

    [[nodiscard]] std::string quote_identifier(std::string_view name) const override;
    [[nodiscard]] std::string quote_literal(std::string_view value) const override;
    [[nodiscard]] std::string cast_to_text(const std::string& expr) const override;
    [[nodiscard]] std::string random_int(int64_t min, int64_t max) const override;
    [[nodiscard]] std::string hash_bucket(const std::string& expr, int64_t buckets) const override;
    [[nodiscard]] std::string list_tables_query() const override;
};

} // namespace sqlanon
