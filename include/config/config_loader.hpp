#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace sqlsession {

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++) or the environment
// ============================================================================

/**
 * TOML layout:
 *
 *   include = "base.toml"            # optional, string or array
 *
 *   [connection]
 *   backend = "postgresql"
 *   host = "db.internal"
 *   port = 5432
 *   username = "app"
 *   password = "${DB_PASSWORD}"      # ${VAR} expanded from the environment
 *   application_name = "billing"
 *   connect_timeout_ms = 30000
 *   security_mode = "require"
 *   auto_create_database = true
 *   persistent_engines = true
 *   tenant_separator = "__"
 *   [connection.keepalive]
 *   enabled = true
 *
 *   [pool]      enabled, min_connections, max_connections, acquire_timeout_ms,
 *               recycle_seconds, idle_timeout_seconds, health_check_query
 *   [retry]     max_retries, backoff, initial_backoff_ms, max_backoff_ms,
 *               multiplier, retry_statements, max_statement_retries
 *   [logging]   level
 *
 *   [[databases]]
 *   name = "orders"
 *   tenants = ["acme", "globex"]
 *   precreate = ["CREATE EXTENSION IF NOT EXISTS pgcrypto"]
 *   [[databases.tables]]
 *   name = "orders"
 *   ddl = "CREATE TABLE orders (id BIGSERIAL PRIMARY KEY)"
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        SessionConfig config;

        static LoadResult ok(SessionConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file (resolves includes)
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Build config from POSTGRES_URI / PG_* / MODULE_NAME variables
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Structural and descriptor-level validation
     * @return One message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SessionConfig& config);

private:
    static LoadResult validate_and_return(SessionConfig config);
};

} // namespace sqlsession
