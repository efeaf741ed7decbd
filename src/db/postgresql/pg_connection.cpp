#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace sqlanon {

namespace {

// RAII wrapper so every early return releases the result
struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

DbResultSet error_result(std::string message) {
    DbResultSet result;
    result.success = false;
    result.error_message = std::move(message);
    return result;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

std::unique_ptr<PgConnection> PgConnection::connect(const std::string& connection_string) {
    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}",
            utils::trim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return error_result("Connection is null");
    }

    PGResultPtr res(PQexec(conn_, sql.c_str()));
    if (!res) {
        return error_result(PQerrorMessage(conn_));
    }

    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK:
            return process_tuples_result(res.get());
        case PGRES_COMMAND_OK:
            return process_command_result(res.get());
        default:
            return error_result(PQerrorMessage(conn_));
    }
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);
    PGResultPtr res(PQexec(conn_, timeout_sql.c_str()));
    return res && PQresultStatus(res.get()) == PGRES_COMMAND_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            const char* val = PQgetvalue(res, i, j);
            row.emplace_back(val ? val : "");
        }
        result.rows.push_back(std::move(row));
    }

    result.affected_rows = static_cast<uint64_t>(nrows);
    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }

    return result;
}

} // namespace sqlanon
