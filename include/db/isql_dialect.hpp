#pragma once

#include "core/database_type.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sqlanon {

/**
 * @brief SQL dialect abstraction
 *
 * Everything the anonymizer needs to render SQL that differs between
 * backends: identifier/literal quoting, a handful of portable expressions
 * used by the built-in strategies, and catalog queries. Stateless; one
 * instance is shared by the engine and every strategy.
 */
class ISqlDialect {
public:
    virtual ~ISqlDialect() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Quote a table or column name ("users" / `users`) */
    [[nodiscard]] virtual std::string quote_identifier(std::string_view name) const = 0;

    /** @brief Quote a string literal, escaping embedded quotes */
    [[nodiscard]] virtual std::string quote_literal(std::string_view value) const = 0;

    /** @brief Expression casting @p expr to the dialect's text type */
    [[nodiscard]] virtual std::string cast_to_text(const std::string& expr) const = 0;

    /** @brief Random integer in [min, max], evaluated per row */
    [[nodiscard]] virtual std::string random_int(int64_t min, int64_t max) const = 0;

    /**
     * @brief Deterministic bucket in [0, buckets) derived from @p expr.
     * NULL input maps to a bucket as well (hashed as the empty string).
     */
    [[nodiscard]] virtual std::string hash_bucket(const std::string& expr, int64_t buckets) const = 0;

    /** @brief Query returning one column: every table/view name of the current schema */
    [[nodiscard]] virtual std::string list_tables_query() const = 0;

    // ---- Portable helpers (same syntax on PostgreSQL and MySQL) ------------

    [[nodiscard]] std::string md5(const std::string& expr) const {
        return "MD5(" + expr + ")";
    }

    [[nodiscard]] std::string concat(const std::vector<std::string>& exprs) const {
        std::string sql = "CONCAT(";
        for (size_t i = 0; i < exprs.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += exprs[i];
        }
        sql += ")";
        return sql;
    }
};

} // namespace sqlanon
