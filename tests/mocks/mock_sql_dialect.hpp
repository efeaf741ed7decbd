#pragma once

#include "db/isql_dialect.hpp"

#include <format>
#include <string>

namespace sqlanon::testing {

/**
 * @brief Dialect rendering backend-specific expressions as readable
 * pseudo-functions (RANDOM_INT, HASH_BUCKET)
 */
class MockSqlDialect : public ISqlDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::POSTGRESQL; }

    [[nodiscard]] std::string quote_identifier(std::string_view name) const override {
        std::string out = "\"";
        for (const char c : name) {
            if (c == '"') out += '"';
            out += c;
        }
        return out + "\"";
    }

    [[nodiscard]] std::string quote_literal(std::string_view value) const override {
        std::string out = "'";
        for (const char c : value) {
            if (c == '\'') out += '\'';
            out += c;
        }
        return out + "'";
    }

    [[nodiscard]] std::string cast_to_text(const std::string& expr) const override {
        return std::format("CAST({} AS TEXT)", expr);
    }

    [[nodiscard]] std::string random_int(int64_t min, int64_t max) const override {
        return std::format("RANDOM_INT({}, {})", min, max);
    }

    [[nodiscard]] std::string hash_bucket(const std::string& expr, int64_t buckets) const override {
        return std::format("HASH_BUCKET({}, {})", expr, buckets);
    }

    [[nodiscard]] std::string list_tables_query() const override {
        return "SELECT name FROM catalog_tables";
    }
};

} // namespace sqlanon::testing
