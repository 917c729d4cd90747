#pragma once

#include "core/database_type.hpp"
#include "core/error.hpp"
#include "db/idb_backend.hpp"
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace sqlsession {

/**
 * @brief Process-wide table of backend constructors
 *
 * Filled by each backend's static registrar and again by main's explicit
 * registration (the later entry wins). EngineFactory asks it for the
 * backend named by the connection descriptor.
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        std::lock_guard lock(mutex_);
        factories_.insert_or_assign(type, std::move(factory));
    }

    /**
     * @throws ConfigurationError if the backend was not compiled in
     */
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        Factory factory;
        {
            std::lock_guard lock(mutex_);
            if (const auto it = factories_.find(type); it != factories_.end()) {
                factory = it->second;
            }
        }
        if (!factory) {
            throw ConfigurationError(std::format(
                "Backend '{}' is not available in this build", database_type_to_string(type)));
        }
        return factory();
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        std::lock_guard lock(mutex_);
        return factories_.contains(type);
    }

private:
    BackendRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<DatabaseType, Factory> factories_;
};

} // namespace sqlsession
