#pragma once

#include "core/database_type.hpp"
#include "db/idb_backend.hpp"

#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace sqlanon {

/**
 * @brief Database backends compiled into this binary, keyed by type
 *
 * main.cpp fills the process-wide instance() with the backends enabled at
 * build time (ENABLE_POSTGRESQL / ENABLE_MYSQL).
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    [[nodiscard]] static BackendRegistry& instance();

    /** @brief Register or replace the backend for @p type */
    void register_backend(DatabaseType type, Factory factory);

    [[nodiscard]] bool has_backend(DatabaseType type) const;

    /** @brief Registered types, in enum order */
    [[nodiscard]] std::vector<DatabaseType> available() const;

    /**
     * @throws ConfigurationError when no backend is registered for @p type
     */
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const;

private:
    std::map<DatabaseType, Factory> factories_;
};

} // namespace sqlanon
