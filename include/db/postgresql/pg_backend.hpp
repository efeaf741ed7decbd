#pragma once

#include "db/idb_backend.hpp"

namespace sqlanon {

/**
 * @brief PostgreSQL backend: creates all PostgreSQL-specific components
 *
 * Creates:
 * - PgConnection (libpq, keyword/value or URI connection strings)
 * - PgDialect
 * - GenericSchemaManager over information_schema.tables
 */
class PgBackend : public IDbBackend {
public:
    PgBackend();

    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::unique_ptr<IDbConnection> create_connection(
        const std::string& connection_string) override;

    [[nodiscard]] std::shared_ptr<const ISqlDialect> dialect() const override {
        return dialect_;
    }

    [[nodiscard]] std::unique_ptr<ISchemaManager> create_schema_manager(
        IDbConnection& conn) override;

private:
    std::shared_ptr<const ISqlDialect> dialect_;
};

} // namespace sqlanon
