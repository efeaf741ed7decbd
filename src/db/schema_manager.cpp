#include "db/schema_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlanon {

// ============================================================================
// execute_or_throw
// ============================================================================

DbResultSet execute_or_throw(IDbConnection& conn, const std::string& sql) {
    auto result = conn.execute(sql);
    if (!result.success) {
        throw ExecutionError(std::format("Statement failed: {} [{}]",
            utils::trim(result.error_message), sql));
    }
    return result;
}

// ============================================================================
// GenericSchemaManager
// ============================================================================

std::vector<std::string> GenericSchemaManager::list_table_names() {
    const auto result = execute_or_throw(conn_, dialect_.list_tables_query());

    std::vector<std::string> names;
    names.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        if (row.empty() || row[0].empty()) continue;
        names.push_back(row[0]);
    }
    return names;
}

void GenericSchemaManager::drop_table(const std::string& table_name) {
    execute_or_throw(conn_, "DROP TABLE " + dialect_.quote_identifier(table_name));
    utils::log::info(std::format("Dropped table {}", table_name));
}

} // namespace sqlanon
