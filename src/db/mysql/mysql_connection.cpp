#include "db/mysql/mysql_connection.hpp"
#include "core/utils.hpp"
#include <charconv>
#include <format>
#include <string_view>

namespace sqlanon {

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::execute(const std::string& sql) {
    DbResultSet result;

    if (!conn_) {
        result.success = false;
        result.error_message = "Connection is null";
        return result;
    }

    if (mysql_query(conn_, sql.c_str()) != 0) {
        result.success = false;
        result.error_message = mysql_error(conn_);
        return result;
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res) {
        result = process_result_set(res);
        mysql_free_result(res);
    } else if (mysql_field_count(conn_) == 0) {
        // DML/DDL: no result set expected
        result = process_affected_rows();
    } else {
        result.success = false;
        result.error_message = mysql_error(conn_);
    }

    return result;
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<std::string> row_data;
        row_data.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                row_data.emplace_back(row[i], lengths[i]);
            } else {
                row_data.emplace_back("");  // NULL → empty string
            }
        }

        result.rows.push_back(std::move(row_data));
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet MysqlConnection::process_affected_rows() {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    return result;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    // MySQL 5.7.8+; only applies to SELECT, UPDATE statements run unbounded
    const std::string sql = std::format("SET SESSION max_execution_time = {}", timeout_ms);
    return mysql_query(conn_, sql.c_str()) == 0;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// Connecting
// ============================================================================

std::unique_ptr<MysqlConnection> MysqlConnection::connect(
    const std::string& connection_string) {

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        utils::log::error("mysql_init failed");
        return nullptr;
    }

    unsigned int timeout = 5;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.c_str(),
        params.port,
        nullptr,  // unix socket
        0         // client flags
    );

    if (!result) {
        utils::log::error(std::format("MySQL connection failed: {}", mysql_error(conn)));
        mysql_close(conn);
        return nullptr;
    }

    return std::make_unique<MysqlConnection>(conn);
}

MysqlConnection::ConnParams MysqlConnection::parse_connection_string(
    const std::string& conn_str) {

    ConnParams params;
    std::string_view sv(conn_str);

    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // user:password before '@'
    const size_t at_pos = sv.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = std::string(creds.substr(0, colon_pos));
            params.password = std::string(creds.substr(colon_pos + 1));
        } else {
            params.user = std::string(creds);
        }
    }

    // host:port/database
    std::string_view host_port = sv;
    const size_t slash_pos = sv.find('/');
    if (slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        params.database = std::string(sv.substr(slash_pos + 1));
    }

    const size_t colon_pos = host_port.find(':');
    if (colon_pos != std::string_view::npos) {
        const std::string_view port_str = host_port.substr(colon_pos + 1);
        unsigned int port = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec == std::errc{} && ptr == port_str.data() + port_str.size() && port > 0) {
            params.port = port;
        }
        host_port = host_port.substr(0, colon_pos);
    }
    if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

} // namespace sqlanon
