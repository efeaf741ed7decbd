#pragma once

#include <string>
#include <vector>

namespace sqlanon {

/**
 * @brief Abstract schema introspection interface
 *
 * Each backend queries its own catalog (information_schema scoped to
 * current_schema() for PG, DATABASE() for MySQL).
 */
class ISchemaManager {
public:
    virtual ~ISchemaManager() = default;

    /**
     * @brief Names of every table-like object (tables and views) of the
     * current schema, sorted by name
     * @throws ExecutionError if the catalog query fails
     */
    [[nodiscard]] virtual std::vector<std::string> list_table_names() = 0;

    /**
     * @brief Drop a table by (unquoted) name
     * @throws ExecutionError on failure
     */
    virtual void drop_table(const std::string& table_name) = 0;
};

} // namespace sqlanon
