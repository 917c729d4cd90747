#pragma once

#include "config/config_types.hpp"
#include "core/database_type.hpp"

#include <string>

namespace sqlsession {

/**
 * @brief Immutable, validated configuration for one logical database target
 *
 * One descriptor serves many logical databases and tenants: the database
 * name is substituted at engine-creation time (see TenantResolver).
 *
 * Validation happens at construction and throws ConfigurationError for:
 * - missing host or username
 * - port 0
 * - pool bounds out of order, or max_connections == 0
 * - negative retry counts, non-positive multiplier, negative backoff delays
 * - an empty tenant separator
 * - an unknown backend name
 */
class ConnectionDescriptor {
public:
    explicit ConnectionDescriptor(ConnectionSettings settings);

    [[nodiscard]] const ConnectionSettings& settings() const { return settings_; }
    [[nodiscard]] DatabaseType backend() const { return backend_; }

    [[nodiscard]] const std::string& host() const { return settings_.host; }
    [[nodiscard]] uint16_t port() const { return settings_.port; }
    [[nodiscard]] const PoolSettings& pool() const { return settings_.pool; }
    [[nodiscard]] const RetrySettings& retry() const { return settings_.retry; }
    [[nodiscard]] SecurityMode security_mode() const { return settings_.security.mode; }

    /**
     * @brief Total connection attempts allowed per engine (max_retries + 1)
     */
    [[nodiscard]] uint32_t max_attempts() const {
        return static_cast<uint32_t>(settings_.retry.max_retries) + 1;
    }

    /**
     * @brief "host:port", the connection target part of engine cache keys
     */
    [[nodiscard]] std::string target() const;

private:
    ConnectionSettings settings_;
    DatabaseType backend_;
};

} // namespace sqlsession
