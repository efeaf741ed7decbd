#pragma once

#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

namespace sqlanon {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    /**
     * @brief Connect with PQconnectdb
     * @return Connection, or nullptr on failure (logged)
     */
    [[nodiscard]] static std::unique_ptr<PgConnection> connect(const std::string& connection_string);

    DbResultSet execute(const std::string& sql) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    static DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    static DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

} // namespace sqlanon
