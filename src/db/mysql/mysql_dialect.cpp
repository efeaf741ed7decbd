#include "db/mysql/mysql_dialect.hpp"

#include <cstdint>
#include <format>

namespace sqlanon {

std::string MysqlDialect::quote_identifier(std::string_view name) const {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted += '`';
    for (const char c : name) {
        if (c == '`') quoted += '`';
        quoted += c;
    }
    quoted += '`';
    return quoted;
}

std::string MysqlDialect::quote_literal(std::string_view value) const {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '\'';
    for (const char c : value) {
        switch (c) {
            case '\'': quoted += "''"; break;
            case '\\': quoted += "\\\\"; break;
            case '\0': quoted += "\\0"; break;
            default:   quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string MysqlDialect::cast_to_text(const std::string& expr) const {
    return std::format("CAST({} AS CHAR)", expr);
}

std::string MysqlDialect::random_int(int64_t min, int64_t max) const {
    const uint64_t span = static_cast<uint64_t>(max) - static_cast<uint64_t>(min) + 1;
    return std::format("FLOOR(RAND() * {} + {})", span, min);
}

std::string MysqlDialect::hash_bucket(const std::string& expr, int64_t buckets) const {
    return std::format("MOD(CRC32(COALESCE({}, '')), {})", cast_to_text(expr), buckets);
}

std::string MysqlDialect::list_tables_query() const {
    return "SELECT TABLE_NAME FROM information_schema.TABLES "
           "WHERE TABLE_SCHEMA = DATABASE() "
           "ORDER BY TABLE_NAME";
}

} // namespace sqlanon
