#pragma once

#include "db/idb_connection.hpp"

#include <string>
#include <utility>
#include <vector>

namespace sqlanon::testing {

/**
 * @brief In-memory connection recording every statement it receives
 *
 * Statements containing a registered fragment fail with the given
 * message; SELECTs matching a registered fragment return canned rows.
 */
class MockDbConnection : public IDbConnection {
public:
    [[nodiscard]] DbResultSet execute(const std::string& sql) override {
        statements_.push_back(sql);

        DbResultSet result;
        for (const auto& [fragment, message] : failures_) {
            if (sql.find(fragment) != std::string::npos) {
                result.error_message = message;
                return result;
            }
        }

        result.success = true;
        for (const auto& [fragment, rows] : results_) {
            if (sql.find(fragment) != std::string::npos) {
                result.has_rows = true;
                result.column_names = {"name"};
                result.rows = rows;
                return result;
            }
        }
        result.affected_rows = affected_rows_;
        return result;
    }

    [[nodiscard]] bool is_connected() const override { return connected_; }

    bool set_query_timeout(uint32_t timeout_ms) override {
        timeout_ms_ = timeout_ms;
        return true;
    }

    void close() override { connected_ = false; }

    // ---- Test controls -----------------------------------------------------

    void fail_on(std::string fragment, std::string message) {
        failures_.emplace_back(std::move(fragment), std::move(message));
    }

    void return_rows(std::string fragment, std::vector<std::vector<std::string>> rows) {
        results_.emplace_back(std::move(fragment), std::move(rows));
    }

    void set_affected_rows(uint64_t n) { affected_rows_ = n; }

    [[nodiscard]] const std::vector<std::string>& statements() const { return statements_; }

    [[nodiscard]] size_t count_containing(const std::string& fragment) const {
        size_t n = 0;
        for (const auto& sql : statements_) {
            if (sql.find(fragment) != std::string::npos) ++n;
        }
        return n;
    }

    [[nodiscard]] uint32_t timeout_ms() const { return timeout_ms_; }

private:
    std::vector<std::string> statements_;
    std::vector<std::pair<std::string, std::string>> failures_;
    std::vector<std::pair<std::string, std::vector<std::vector<std::string>>>> results_;
    uint64_t affected_rows_ = 0;
    uint32_t timeout_ms_ = 0;
    bool connected_ = true;
};

} // namespace sqlanon::testing
