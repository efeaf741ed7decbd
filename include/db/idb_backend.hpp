#pragma once

#include "core/database_type.hpp"
#include "db/idb_connection.hpp"
#include "db/ischema_manager.hpp"
#include "db/isql_dialect.hpp"
#include <memory>
#include <string>

namespace sqlanon {

/**
 * @brief Abstract database backend: creates all DB-specific components
 *
 * Each database type (PostgreSQL, MySQL) provides a concrete implementation
 * that creates the right connection, dialect and schema manager.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 *   auto conn = backend->create_connection("host=localhost dbname=app");
 *   auto schema = backend->create_schema_manager(*conn);
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /**
     * @brief Open a connection
     * @return New connection, or nullptr on failure (reason is logged)
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create_connection(
        const std::string& connection_string) = 0;

    /** @brief SQL dialect of this backend */
    [[nodiscard]] virtual std::shared_ptr<const ISqlDialect> dialect() const = 0;

    /** @brief Schema manager bound to @p conn (which must outlive it) */
    [[nodiscard]] virtual std::unique_ptr<ISchemaManager> create_schema_manager(
        IDbConnection& conn) = 0;
};

} // namespace sqlanon
