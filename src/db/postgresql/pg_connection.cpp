#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <memory>

namespace sqlsession {

namespace {

struct PgResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};

using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

DbResultSet rows_of(PGresult* res) {
    DbResultSet out;
    out.success = true;
    out.has_rows = true;

    const int columns = PQnfields(res);
    const int rows = PQntuples(res);
    out.column_names.reserve(static_cast<size_t>(columns));
    for (int c = 0; c < columns; ++c) {
        out.column_names.emplace_back(PQfname(res, c));
    }

    out.rows.resize(static_cast<size_t>(rows));
    for (int r = 0; r < rows; ++r) {
        auto& row = out.rows[static_cast<size_t>(r)];
        row.reserve(static_cast<size_t>(columns));
        for (int c = 0; c < columns; ++c) {
            // NULL comes back as an empty string
            row.emplace_back(PQgetisnull(res, r, c) ? "" : PQgetvalue(res, r, c));
        }
    }
    out.affected_rows = static_cast<uint64_t>(rows);
    return out;
}

DbResultSet command_of(PGresult* res) {
    DbResultSet out;
    out.success = true;
    const char* tuples = PQcmdTuples(res);
    if (tuples && *tuples) {
        out.affected_rows = utils::try_parse_int<uint64_t>(tuples).value_or(0);
    }
    return out;
}

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    const PgResultPtr res(PQexec(conn_, sql.c_str()));
    if (!res) {
        return DbResultSet::failure(utils::trim(PQerrorMessage(conn_)));
    }

    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK:
            return rows_of(res.get());
        case PGRES_COMMAND_OK:
        case PGRES_EMPTY_QUERY:
            return command_of(res.get());
        default: {
            const char* state = PQresultErrorField(res.get(), PG_DIAG_SQLSTATE);
            return DbResultSet::failure(utils::trim(PQresultErrorMessage(res.get())),
                                        state ? state : "");
        }
    }
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    return is_connected() && execute(health_check_query).success;
}

bool PgConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

ConnectFailure PgConnectionFactory::classify_error(std::string_view message) {
    if (utils::contains_icase(message, "database \"") &&
        utils::contains_icase(message, "does not exist")) {
        return ConnectFailure::DATABASE_MISSING;
    }
    if (utils::contains_icase(message, "authentication failed") ||
        utils::contains_icase(message, "server login has been failing") ||
        utils::contains_icase(message, "no pg_hba.conf entry") ||
        utils::contains_icase(message, "password is required") ||
        (utils::contains_icase(message, "role \"") &&
         utils::contains_icase(message, "does not exist"))) {
        return ConnectFailure::AUTHENTICATION;
    }
    if (utils::contains_icase(message, "invalid connection option") ||
        utils::contains_icase(message, "missing \"=\"") ||
        utils::contains_icase(message, "invalid sslmode value") ||
        utils::contains_icase(message, "invalid port number") ||
        utils::contains_icase(message, "invalid integer value")) {
        return ConnectFailure::INVALID_TARGET;
    }
    // Refused, timeout, reset, starting up, too many clients, DNS hiccups
    return ConnectFailure::TRANSIENT;
}

ConnectResult PgConnectionFactory::connect(const std::string& connection_string) {
    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        return ConnectResult::error(ConnectFailure::TRANSIENT, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string message = utils::trim(PQerrorMessage(conn));
        PQfinish(conn);
        return ConnectResult::error(classify_error(message), std::move(message));
    }

    return ConnectResult::success(std::make_unique<PgConnection>(conn));
}

} // namespace sqlsession
