#include "db/backend_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <string>
#include <utility>

namespace sqlanon {

BackendRegistry& BackendRegistry::instance() {
    static BackendRegistry registry;
    return registry;
}

void BackendRegistry::register_backend(DatabaseType type, Factory factory) {
    factories_[type] = std::move(factory);
}

bool BackendRegistry::has_backend(DatabaseType type) const {
    return factories_.contains(type);
}

std::vector<DatabaseType> BackendRegistry::available() const {
    std::vector<DatabaseType> types;
    types.reserve(factories_.size());
    for (const auto& [type, factory] : factories_) {
        types.push_back(type);
    }
    return types;
}

std::unique_ptr<IDbBackend> BackendRegistry::create(DatabaseType type) const {
    const auto it = factories_.find(type);
    if (it == factories_.end()) {
        std::vector<std::string> names;
        for (const auto available_type : available()) {
            names.emplace_back(database_type_to_string(available_type));
        }
        throw ConfigurationError(std::format("Backend \"{}\" is not compiled in (available: {})",
            database_type_to_string(type), names.empty() ? "none" : utils::join(names, ", ")));
    }
    return it->second();
}

} // namespace sqlanon
