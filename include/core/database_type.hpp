#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <string>
#include <string_view>

namespace sqlsession {

/**
 * @brief Server families a backend can be registered for
 */
enum class DatabaseType {
    POSTGRESQL,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return "postgresql";
        default: return "unknown";
    }
}

/**
 * @brief Backend from its config name: "postgresql", "postgres" or "pg"
 * @throws ConfigurationError for anything else
 */
[[nodiscard]] inline DatabaseType parse_database_type(std::string_view name) {
    const std::string lower = utils::to_lower(std::string(name));
    if (lower == "postgresql" || lower == "postgres" || lower == "pg") {
        return DatabaseType::POSTGRESQL;
    }
    throw ConfigurationError(std::format("Unknown database backend: {}", name));
}

} // namespace sqlsession
