#include "db/update_query.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>

namespace sqlanon {

UpdateQuery::UpdateQuery(const ISqlDialect& dialect, std::string table)
    : dialect_(dialect), table_(std::move(table)) {}

UpdateQuery& UpdateQuery::set(std::string_view column, std::string expression) {
    if (assigns(column)) {
        throw UsageError(std::format(
            "Column \"{}\".\"{}\" is assigned twice in the same UPDATE", table_, column));
    }
    assignments_.emplace_back(std::string(column), std::move(expression));
    return *this;
}

UpdateQuery& UpdateQuery::where(std::string condition) {
    conditions_.emplace_back(std::move(condition));
    return *this;
}

std::string UpdateQuery::column(std::string_view name) const {
    return dialect_.quote_identifier(table_) + "." + dialect_.quote_identifier(name);
}

bool UpdateQuery::assigns(std::string_view column) const {
    return std::any_of(assignments_.begin(), assignments_.end(),
        [column](const auto& assignment) { return assignment.first == column; });
}

std::string UpdateQuery::to_sql() const {
    if (assignments_.empty()) {
        throw UsageError(std::format("UPDATE on \"{}\" has no assignment", table_));
    }

    std::string sql = "UPDATE ";
    sql += dialect_.quote_identifier(table_);
    sql += " SET ";
    for (size_t i = 0; i < assignments_.size(); ++i) {
        if (i > 0) sql += ", ";
        // SET targets stay unqualified: PostgreSQL rejects "table"."column" there
        sql += dialect_.quote_identifier(assignments_[i].first);
        sql += " = ";
        sql += assignments_[i].second;
    }

    if (!conditions_.empty()) {
        sql += " WHERE ";
        for (size_t i = 0; i < conditions_.size(); ++i) {
            if (i > 0) sql += " AND ";
            sql += "(";
            sql += conditions_[i];
            sql += ")";
        }
    }
    return sql;
}

} // namespace sqlanon
