#pragma once

#include "db/isql_dialect.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlanon {

/**
 * @brief UPDATE statement builder scoped to one table
 *
 * Shared by every strategy of a table in combined mode, so contributions
 * must compose: SET assignments are per column (a column may only be
 * assigned once), WHERE conditions are ANDed together.
 *
 * Usage:
 *   UpdateQuery query(dialect, "users");
 *   query.set("email", dialect.quote_literal("x"));
 *   query.where(query.column("email") + " IS NOT NULL");
 *   conn.execute(query.to_sql());
 *   // UPDATE "users" SET "email" = 'x' WHERE ("users"."email" IS NOT NULL)
 */
class UpdateQuery {
public:
    UpdateQuery(const ISqlDialect& dialect, std::string table);

    /**
     * @brief Assign @p expression (raw SQL) to @p column
     * @throws UsageError if the column is already assigned
     */
    UpdateQuery& set(std::string_view column, std::string expression);

    /** @brief Add a condition, ANDed with the others */
    UpdateQuery& where(std::string condition);

    /** @brief Qualified, quoted reference to a column of the target table */
    [[nodiscard]] std::string column(std::string_view name) const;

    [[nodiscard]] const std::string& table() const { return table_; }
    [[nodiscard]] const ISqlDialect& dialect() const { return dialect_; }

    [[nodiscard]] bool has_assignments() const { return !assignments_.empty(); }
    [[nodiscard]] size_t assignment_count() const { return assignments_.size(); }
    [[nodiscard]] bool assigns(std::string_view column) const;

    /**
     * @brief Render the statement
     * @throws UsageError when nothing is assigned
     */
    [[nodiscard]] std::string to_sql() const;

private:
    const ISqlDialect& dialect_;
    std::string table_;
    std::vector<std::pair<std::string, std::string>> assignments_;
    std::vector<std::string> conditions_;
};

} // namespace sqlanon
