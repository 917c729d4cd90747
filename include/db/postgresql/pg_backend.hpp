#pragma once

#include "db/idb_backend.hpp"

namespace sqlsession {

/**
 * @brief PostgreSQL backend: creates all PG-specific components
 *
 * Creates:
 * - PgConnectionFactory → GenericConnectionPool
 * - libpq keyword/value connection strings
 * - CREATE DATABASE / information_schema statements
 *
 * Auto-registers with BackendRegistry at static init time.
 */
class PgBackend : public IDbBackend {
public:
    PgBackend();

    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionFactory> connection_factory() override {
        return factory_;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config,
        std::unique_ptr<IDbConnection> seed = nullptr) override;

    [[nodiscard]] std::string build_connection_string(
        const ConnectionSettings& settings, const std::string& database) const override;

    [[nodiscard]] std::string create_database_statement(const std::string& database) const override;

    [[nodiscard]] bool is_duplicate_database(const DbResultSet& result) const override;

    [[nodiscard]] std::string table_exists_query(
        const std::string& schema, const std::string& table) const override;

    // libpq conninfo value quoting: 'value' with \' and \\ escaped
    [[nodiscard]] static std::string quote_conninfo_value(const std::string& value);

    // "identifier" with embedded quotes doubled
    [[nodiscard]] static std::string quote_identifier(const std::string& name);

    // 'literal' with embedded quotes doubled
    [[nodiscard]] static std::string quote_literal(const std::string& value);

private:
    std::shared_ptr<IConnectionFactory> factory_;
};

} // namespace sqlsession
