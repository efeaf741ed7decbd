#pragma once

#include "core/utils.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sqlanon {

/**
 * @brief Database engines the anonymizer can drive
 */
enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return "postgresql";
        case DatabaseType::MYSQL:      return "mysql";
    }
    return "unknown";
}

/**
 * @brief Parse the `[database] type` setting, case-insensitive
 *
 * postgresql | postgres | pg -> POSTGRESQL, mysql | mariadb -> MYSQL
 */
[[nodiscard]] inline std::optional<DatabaseType> parse_database_type(std::string_view name) {
    const std::string lower = utils::to_lower(std::string(name));
    if (lower == "postgresql" || lower == "postgres" || lower == "pg") {
        return DatabaseType::POSTGRESQL;
    }
    if (lower == "mysql" || lower == "mariadb") {
        return DatabaseType::MYSQL;
    }
    return std::nullopt;
}

} // namespace sqlanon
