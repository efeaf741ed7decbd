#pragma once

#include "db/idb_backend.hpp"

namespace sqlanon {

/**
 * @brief MySQL backend: creates all MySQL-specific components
 *
 * Creates:
 * - MysqlConnection (mysql:// or mariadb:// URIs)
 * - MysqlDialect
 * - GenericSchemaManager over information_schema.TABLES
 */
class MysqlBackend : public IDbBackend {
public:
    MysqlBackend();

    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MYSQL;
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
