#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/backend_registry.hpp"
#include <format>

namespace sqlsession {

PgBackend::PgBackend()
    : factory_(std::make_shared<PgConnectionFactory>()) {}

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config,
    std::unique_ptr<IDbConnection> seed) {

    return std::make_shared<GenericConnectionPool>(
        db_name, config, factory_, std::move(seed));
}

std::string PgBackend::quote_conninfo_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

std::string PgBackend::quote_identifier(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string PgBackend::quote_literal(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string PgBackend::build_connection_string(
    const ConnectionSettings& settings, const std::string& database) const {

    std::string conn;
    const auto add = [&conn](std::string_view key, const std::string& value) {
        if (!conn.empty()) conn += ' ';
        conn += key;
        conn += '=';
        conn += quote_conninfo_value(value);
    };

    add("host", settings.host);
    add("port", std::to_string(settings.port));
    add("user", settings.username);
    if (!settings.password.empty()) {
        add("password", settings.password);
    }
    add("dbname", database);

    // libpq takes whole seconds; round partial seconds up
    if (settings.connect_timeout.count() > 0) {
        const auto secs = (settings.connect_timeout.count() + 999) / 1000;
        add("connect_timeout", std::to_string(secs));
    }

    if (!settings.application_name.empty()) {
        add("application_name", settings.application_name);
    }

    const auto& sec = settings.security;
    add("sslmode", std::string(security_mode_to_string(sec.mode)));
    if (!sec.root_cert_file.empty()) add("sslrootcert", sec.root_cert_file);
    if (!sec.cert_file.empty())      add("sslcert", sec.cert_file);
    if (!sec.key_file.empty())       add("sslkey", sec.key_file);

    const auto& ka = settings.keepalive;
    if (ka.enabled) {
        add("keepalives", "1");
        add("keepalives_idle", std::to_string(ka.idle_seconds));
        add("keepalives_interval", std::to_string(ka.interval_seconds));
        add("keepalives_count", std::to_string(ka.count));
    } else {
        add("keepalives", "0");
    }

    return conn;
}

std::string PgBackend::create_database_statement(const std::string& database) const {
    return std::format("CREATE DATABASE {}", quote_identifier(database));
}

bool PgBackend::is_duplicate_database(const DbResultSet& result) const {
    if (result.success) return false;
    // 42P04 duplicate_database; 23505 when two CREATE DATABASE race on pg_database
    if (result.sql_state == "42P04" || result.sql_state == "23505") return true;
    return result.sql_state.empty() &&
           result.error_message.find("already exists") != std::string::npos;
}

std::string PgBackend::table_exists_query(
    const std::string& schema, const std::string& table) const {
    return std::format(
        "SELECT 1 FROM information_schema.tables "
        "WHERE table_schema = {} AND table_name = {}",
        quote_literal(schema), quote_literal(table));
}

// Auto-register PostgreSQL backend at static initialization
namespace {
    struct PgBackendRegistrar {
        PgBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                DatabaseType::POSTGRESQL,
                [] { return std::make_unique<PgBackend>(); });
        }
    };
    static PgBackendRegistrar pg_registrar;
}

} // namespace sqlsession
