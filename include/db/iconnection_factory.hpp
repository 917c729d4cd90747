#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace sqlsession {

/**
 * @brief Why a connection attempt failed
 *
 * TRANSIENT failures (refused, timeout, server starting up) are retried by
 * the engine factory; everything else aborts the attempt sequence.
 */
enum class ConnectFailure {
    NONE,
    TRANSIENT,
    AUTHENTICATION,
    DATABASE_MISSING,
    INVALID_TARGET
};

[[nodiscard]] inline std::string_view connect_failure_to_string(ConnectFailure f) {
    switch (f) {
        case ConnectFailure::NONE:             return "none";
        case ConnectFailure::TRANSIENT:        return "transient";
        case ConnectFailure::AUTHENTICATION:   return "authentication";
        case ConnectFailure::DATABASE_MISSING: return "database_missing";
        case ConnectFailure::INVALID_TARGET:   return "invalid_target";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of one connection attempt
 */
struct ConnectResult {
    std::unique_ptr<IDbConnection> connection;   // non-null on success
    ConnectFailure failure = ConnectFailure::NONE;
    std::string error_message;

    [[nodiscard]] bool ok() const { return connection != nullptr; }

    static ConnectResult success(std::unique_ptr<IDbConnection> conn) {
        ConnectResult r;
        r.connection = std::move(conn);
        return r;
    }

    static ConnectResult error(ConnectFailure failure, std::string message) {
        ConnectResult r;
        r.failure = failure;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory that wraps the native
 * connection function (PQconnectdb, ...) and classifies failures.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new database connection
     * @param connection_string Backend-specific connection string
     */
    [[nodiscard]] virtual ConnectResult connect(const std::string& connection_string) = 0;
};

} // namespace sqlsession
