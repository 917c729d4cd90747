#include "session/session.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <thread>
#include <utility>

namespace sqlsession {

namespace {

bool connection_lost(const DbResultSet& result, const IDbConnection& conn) {
    return !conn.is_connected() ||
           utils::contains_icase(result.error_message, "server closed the connection unexpectedly");
}

} // namespace

Session::Session(std::shared_ptr<Engine> engine, TenantId tenant, SessionOptions options)
    : engine_(std::move(engine)),
      tenant_(std::move(tenant)),
      options_(std::move(options)),
      database_(engine_ ? engine_->database() : std::string{}) {
    if (!engine_) {
        throw SessionError("Session requires an engine", OrchestrationState::SESSION_ACTIVE);
    }
}

Session::~Session() {
    try {
        close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Error closing session on database '{}': {}",
            database_, e.what()));
    }
}

Session::Session(Session&& other) noexcept
    : engine_(std::move(other.engine_)),
      tenant_(std::move(other.tenant_)),
      options_(std::move(other.options_)),
      database_(std::move(other.database_)),
      conn_(std::move(other.conn_)),
      in_transaction_(std::exchange(other.in_transaction_, false)),
      statements_in_transaction_(std::exchange(other.statements_in_transaction_, 0)),
      closed_(std::exchange(other.closed_, true)) {}

const std::string& Session::database() const {
    return database_;
}

void Session::ensure_open() const {
    if (closed_) {
        throw SessionError(std::format("Session on database '{}' is closed", database_),
                           OrchestrationState::CLOSED);
    }
}

DbResultSet Session::run(const std::string& sql) {
    if (!conn_) {
        conn_ = engine_->connect();
    }
    if (!in_transaction_) {
        auto begin = conn_->get()->execute("BEGIN");
        if (!begin.success) {
            return begin;
        }
        in_transaction_ = true;
        statements_in_transaction_ = 0;
    }
    return conn_->get()->execute(sql);
}

DbResultSet Session::execute(const std::string& sql) {
    ensure_open();

    for (int retry = 0;; ++retry) {
        const bool first_in_transaction = !in_transaction_ || statements_in_transaction_ == 0;
        auto result = run(sql);

        if (result.success) {
            ++statements_in_transaction_;
            return result;
        }

        const bool lost = connection_lost(result, *conn_->get());
        if (lost && options_.retry_statements && first_in_transaction &&
            retry < options_.max_statement_retries) {
            const auto delay = options_.retry_backoff
                ? options_.retry_backoff->delay(static_cast<uint32_t>(retry + 1))
                : std::chrono::milliseconds(0);
            utils::log::warn(std::format(
                "Connection to database '{}' lost, retrying statement ({}/{}) in {}ms",
                database_, retry + 1, options_.max_statement_retries, delay.count()));
            conn_->invalidate();
            release_connection();
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            continue;
        }

        if (lost) {
            conn_->invalidate();
            release_connection();
        }
        throw SessionError(std::format("Statement failed on database '{}': {}",
            database_, result.error_message));
    }
}

bool Session::end_transaction(const char* statement) {
    if (!in_transaction_ || !conn_) {
        release_connection();
        return true;
    }
    const auto result = conn_->get()->execute(statement);
    if (!result.success) {
        utils::log::warn(std::format("{} failed on database '{}': {}",
            statement, database_, result.error_message));
        conn_->invalidate();
    }
    release_connection();
    return result.success;
}

void Session::commit() {
    ensure_open();
    if (!end_transaction("COMMIT")) {
        throw SessionError(std::format("Commit failed on database '{}'", database_));
    }
}

void Session::rollback() {
    ensure_open();
    if (!end_transaction("ROLLBACK")) {
        throw SessionError(std::format("Rollback failed on database '{}'", database_));
    }
}

void Session::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    // A failed rollback is logged and its connection discarded
    (void)end_transaction("ROLLBACK");
    engine_.reset();
    if (options_.on_close) {
        auto on_close = std::move(options_.on_close);
        options_.on_close = nullptr;
        on_close();
    }
}

void Session::release_connection() {
    conn_.reset();
    in_transaction_ = false;
    statements_in_transaction_ = 0;
}

} // namespace sqlsession
