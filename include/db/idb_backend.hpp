#pragma once

#include "config/config_types.hpp"
#include "core/database_type.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include <memory>
#include <string>

namespace sqlsession {

/**
 * @brief Abstract database backend: everything dialect-specific
 *
 * Each database type provides a concrete implementation that knows how to
 * open connections, build connection strings, create databases, and
 * recognize its own error conditions.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 *   auto conn_str = backend->build_connection_string(settings, "acme__orders");
 *   auto result = backend->connection_factory()->connect(conn_str);
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Factory opening native connections */
    [[nodiscard]] virtual std::shared_ptr<IConnectionFactory> connection_factory() = 0;

    /** @brief Create a connection pool for one resolved database */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config,
        std::unique_ptr<IDbConnection> seed = nullptr) = 0;

    /**
     * @brief Connection string for a resolved database name
     *
     * Carries credentials, connect timeout, application name, keepalive and
     * security parameters from the settings.
     */
    [[nodiscard]] virtual std::string build_connection_string(
        const ConnectionSettings& settings, const std::string& database) const = 0;

    /** @brief Statement creating a database (run on the maintenance database) */
    [[nodiscard]] virtual std::string create_database_statement(const std::string& database) const = 0;

    /** @brief True if a failed CREATE DATABASE means "already exists" */
    [[nodiscard]] virtual bool is_duplicate_database(const DbResultSet& result) const = 0;

    /** @brief Query returning a row iff the table exists in the schema */
    [[nodiscard]] virtual std::string table_exists_query(
        const std::string& schema, const std::string& table) const = 0;
};

} // namespace sqlsession
