#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsession {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief Transport security mode, passed through opaquely to the client library
 */
enum class SecurityMode {
    DISABLE,
    ALLOW,
    PREFER,
    REQUIRE,
    VERIFY_CA,
    VERIFY_FULL
};

[[nodiscard]] inline std::string_view security_mode_to_string(SecurityMode mode) {
    switch (mode) {
        case SecurityMode::DISABLE:     return "disable";
        case SecurityMode::ALLOW:       return "allow";
        case SecurityMode::PREFER:      return "prefer";
        case SecurityMode::REQUIRE:     return "require";
        case SecurityMode::VERIFY_CA:   return "verify-ca";
        case SecurityMode::VERIFY_FULL: return "verify-full";
        default: return "prefer";
    }
}

[[nodiscard]] std::optional<SecurityMode> parse_security_mode(std::string_view name);

struct SecurityConfig {
    SecurityMode mode = SecurityMode::PREFER;
    std::string root_cert_file;
    std::string cert_file;
    std::string key_file;
};

struct KeepaliveConfig {
    bool enabled = true;
    int idle_seconds = 30;
    int interval_seconds = 10;
    int count = 5;
};

struct PoolSettings {
    bool enabled = false;                          // false = open/close per checkout
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::seconds recycle{300};             // 0 = never recycle
    std::chrono::seconds idle_timeout{30};         // idle longer than this → pre-ping
    std::string health_check_query{"SELECT 1"};
};

enum class BackoffKind {
    FIXED,
    EXPONENTIAL
};

struct RetrySettings {
    int max_retries = 5;                           // additional attempts after the first
    BackoffKind backoff = BackoffKind::EXPONENTIAL;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    double multiplier = 2.0;

    // Retrying sessions: re-run a statement whose connection was dropped
    bool retry_statements = false;
    int max_statement_retries = 3;
};

/**
 * @brief Raw connection settings, as read from config or environment
 *
 * Validated (and frozen) by ConnectionDescriptor.
 */
struct ConnectionSettings {
    std::string backend = "postgresql";
    std::string host;
    uint16_t port = 5432;
    std::string username;
    std::string password;
    std::string application_name;
    std::chrono::milliseconds connect_timeout{30000};
    SecurityConfig security;
    KeepaliveConfig keepalive;
    PoolSettings pool;
    RetrySettings retry;

    bool auto_create_database = true;
    bool persistent_engines = true;               // false = never cache engines
    std::string tenant_separator = "__";
    std::string default_schema = "public";
    std::string maintenance_database = "postgres"; // used for CREATE DATABASE
};

struct LoggingConfig {
    std::string level = "info";
};

struct TableDefinition {
    std::string name;
    std::string ddl;                               // CREATE TABLE statement
};

/**
 * @brief Per-database provisioning declared in config ([[databases]])
 */
struct DatabaseProvisioning {
    std::string name;
    std::vector<std::string> tenants;              // empty = provision without tenant
    std::vector<std::string> precreate;            // statements run before tables
    std::vector<std::string> postcreate;           // statements run after tables
    std::vector<TableDefinition> tables;
};

struct SessionConfig {
    ConnectionSettings connection;
    LoggingConfig logging;
    std::vector<DatabaseProvisioning> databases;
};

} // namespace sqlsession
