#pragma once

#include "db/idb_connection.hpp"
#include "db/ischema_manager.hpp"
#include "db/isql_dialect.hpp"

namespace sqlanon {

/**
 * @brief Schema manager working on any backend through its dialect
 *
 * Borrows the connection and dialect; both must outlive it.
 */
class GenericSchemaManager : public ISchemaManager {
public:
    GenericSchemaManager(IDbConnection& conn, const ISqlDialect& dialect)
        : conn_(conn), dialect_(dialect) {}

    [[nodiscard]] std::vector<std::string> list_table_names() override;
    void drop_table(const std::string& table_name) override;

private:
    IDbConnection& conn_;
    const ISqlDialect& dialect_;
};

} // namespace sqlanon
