#include "db/postgresql/pg_dialect.hpp"

#include <cstdint>
#include <format>

namespace sqlanon {

std::string PgDialect::quote_identifier(std::string_view name) const {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted += '"';
    for (const char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string PgDialect::quote_literal(std::string_view value) const {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '\'';
    for (const char c : value) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string PgDialect::cast_to_text(const std::string& expr) const {
    return std::format("CAST({} AS TEXT)", expr);
}

std::string PgDialect::random_int(int64_t min, int64_t max) const {
    const uint64_t span = static_cast<uint64_t>(max) - static_cast<uint64_t>(min) + 1;
    return std::format("FLOOR(RANDOM() * {} + {})::BIGINT", span, min);
}

std::string PgDialect::hash_bucket(const std::string& expr, int64_t buckets) const {
    // hashtext() is int4; widen before ABS() so INT_MIN cannot overflow
    return std::format("MOD(ABS(HASHTEXT(COALESCE({}, ''))::BIGINT), {})",
        cast_to_text(expr), buckets);
}

std::string PgDialect::list_tables_query() const {
    return "SELECT table_name FROM information_schema.tables "
           "WHERE table_schema = current_schema() "
           "ORDER BY table_name";
}

} // namespace sqlanon
