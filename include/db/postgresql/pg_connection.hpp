#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>
#include <string_view>

namespace sqlsession {

/**
 * @brief libpq connection (owns the PGconn)
 *
 * Statements run through PQexec, so a multi-statement string is one round
 * trip and the last result is reported. SQLSTATE is copied into
 * DbResultSet::sql_state on failure.
 */
class PgConnection : public IDbConnection {
public:
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Opens connections with PQconnectdb and classifies failures from the
 * server/libpq error text.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    ConnectResult connect(const std::string& connection_string) override;

    /**
     * @brief Map a libpq connection error message to a failure kind
     */
    [[nodiscard]] static ConnectFailure classify_error(std::string_view message);
};

} // namespace sqlsession
