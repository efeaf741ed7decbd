#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_dialect.hpp"
#include "db/schema_manager.hpp"

namespace sqlanon {

PgBackend::PgBackend()
    : dialect_(std::make_shared<PgDialect>()) {}

std::unique_ptr<IDbConnection> PgBackend::create_connection(
    const std::string& connection_string) {

    return PgConnection::connect(connection_string);
}

std::unique_ptr<ISchemaManager> PgBackend::create_schema_manager(IDbConnection& conn) {
    return std::make_unique<GenericSchemaManager>(conn, *dialect_);
}

} // namespace sqlanon
