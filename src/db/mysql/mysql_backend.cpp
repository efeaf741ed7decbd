#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_dialect.hpp"
#include "db/schema_manager.hpp"

namespace sqlanon {

MysqlBackend::MysqlBackend()
    : dialect_(std::make_shared<MysqlDialect>()) {}

std::unique_ptr<IDbConnection> MysqlBackend::create_connection(
    const std::string& connection_string) {

    return MysqlConnection::connect(connection_string);
}

std::unique_ptr<ISchemaManager> MysqlBackend::create_schema_manager(IDbConnection& conn) {
    return std::make_unique<GenericSchemaManager>(conn, *dialect_);
}

} // namespace sqlanon
