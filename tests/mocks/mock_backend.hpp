#pragma once

#include "db/generic_connection_pool.hpp"
#include "db/idb_backend.hpp"
#include "core/utils.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sqlsession::testing {

/**
 * @brief In-memory database server shared by mock connections
 *
 * Keeps, per database, the committed statement log and the set of tables
 * created through CREATE TABLE. Failure injection covers the connect path
 * (transient / authentication / missing database / slow connects) and the
 * statement path (rejected patterns, dropped connections).
 */
class MockServer {
public:
    // ---- setup -------------------------------------------------------------

    void add_database(const std::string& name) {
        std::lock_guard lock(mutex_);
        databases_.insert(name);
    }

    /** @brief When false, only add_database()/CREATE DATABASE names exist */
    void set_databases_exist_by_default(bool v) {
        std::lock_guard lock(mutex_);
        databases_exist_by_default_ = v;
    }

    void add_table(const std::string& db, const std::string& table) {
        std::lock_guard lock(mutex_);
        tables_[db].insert(table);
    }

    void fail_next_connects(int n, ConnectFailure kind = ConnectFailure::TRANSIENT,
                            std::string message = "could not connect to server: Connection refused") {
        std::lock_guard lock(mutex_);
        failing_connects_ = n;
        connect_failure_ = kind;
        connect_failure_message_ = std::move(message);
    }

    void set_connect_delay(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        connect_delay_ = delay;
    }

    void reject_statements_containing(std::string pattern) {
        std::lock_guard lock(mutex_);
        rejected_patterns_.push_back(std::move(pattern));
    }

    /** @brief The next n regular statements lose their connection */
    void drop_next_statements(int n) {
        std::lock_guard lock(mutex_);
        dropped_statements_ = n;
    }

    /** @brief CREATE DATABASE reports "already exists" (a concurrent creator won) */
    void set_create_database_race(bool v) {
        std::lock_guard lock(mutex_);
        create_database_race_ = v;
    }

    // ---- inspection --------------------------------------------------------

    [[nodiscard]] bool has_database(const std::string& name) const {
        std::lock_guard lock(mutex_);
        return database_exists(name);
    }

    [[nodiscard]] bool has_table(const std::string& db, const std::string& table) const {
        std::lock_guard lock(mutex_);
        const auto it = tables_.find(db);
        return it != tables_.end() && it->second.count(table) > 0;
    }

    [[nodiscard]] std::vector<std::string> committed(const std::string& db) const {
        std::lock_guard lock(mutex_);
        const auto it = committed_.find(db);
        return it == committed_.end() ? std::vector<std::string>{} : it->second;
    }

    [[nodiscard]] size_t count_committed(const std::string& db, const std::string& needle) const {
        size_t n = 0;
        for (const auto& stmt : committed(db)) {
            if (stmt.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    [[nodiscard]] size_t connect_attempts() const { return connect_attempts_.load(); }
    [[nodiscard]] size_t successful_connects() const { return successful_connects_.load(); }
    [[nodiscard]] size_t create_database_calls() const { return create_database_calls_.load(); }
    [[nodiscard]] int open_connections() const { return open_connections_.load(); }
    [[nodiscard]] size_t statements_executed() const { return statements_executed_.load(); }

    // ---- used by MockConnection / MockConnectionFactory --------------------

    ConnectResult connect(const std::string& db);

    void commit(const std::string& db, const std::vector<std::string>& statements) {
        std::lock_guard lock(mutex_);
        auto& log = committed_[db];
        for (const auto& stmt : statements) {
            log.push_back(stmt);
            const std::string upper = utils::to_upper(stmt);
            if (upper.rfind("CREATE TABLE ", 0) == 0) {
                auto rest = stmt.substr(13);
                if (utils::to_upper(rest).rfind("IF NOT EXISTS ", 0) == 0) {
                    rest = rest.substr(14);
                }
                const auto end = rest.find_first_of(" (");
                tables_[db].insert(rest.substr(0, end));
            }
        }
    }

    DbResultSet create_database(const std::string& name) {
        create_database_calls_.fetch_add(1);
        std::lock_guard lock(mutex_);
        if (create_database_race_ || databases_.count(name) > 0) {
            databases_.insert(name);
            return DbResultSet::failure(
                "ERROR:  database \"" + name + "\" already exists", "42P04");
        }
        databases_.insert(name);
        DbResultSet ok;
        ok.success = true;
        return ok;
    }

    /** @return empty string when the statement may run, else the error */
    std::string check_statement(const std::string& sql, bool& dropped) {
        std::lock_guard lock(mutex_);
        dropped = false;
        if (dropped_statements_ > 0) {
            --dropped_statements_;
            dropped = true;
            return "server closed the connection unexpectedly";
        }
        for (const auto& pattern : rejected_patterns_) {
            if (sql.find(pattern) != std::string::npos) {
                return "ERROR:  statement rejected: " + sql;
            }
        }
        return {};
    }

    void note_statement() { statements_executed_.fetch_add(1); }
    void connection_closed() { open_connections_.fetch_sub(1); }

private:
    bool database_exists(const std::string& name) const {
        return databases_exist_by_default_ || name == "postgres" || databases_.count(name) > 0;
    }

    mutable std::mutex mutex_;
    std::set<std::string> databases_;
    bool databases_exist_by_default_ = true;
    std::unordered_map<std::string, std::set<std::string>> tables_;
    std::unordered_map<std::string, std::vector<std::string>> committed_;

    int failing_connects_ = 0;
    ConnectFailure connect_failure_ = ConnectFailure::TRANSIENT;
    std::string connect_failure_message_;
    std::chrono::milliseconds connect_delay_{0};
    std::vector<std::string> rejected_patterns_;
    int dropped_statements_ = 0;
    bool create_database_race_ = false;

    std::atomic<size_t> connect_attempts_{0};
    std::atomic<size_t> successful_connects_{0};
    std::atomic<size_t> create_database_calls_{0};
    std::atomic<size_t> statements_executed_{0};
    std::atomic<int> open_connections_{0};
};

/**
 * @brief Connection with BEGIN/COMMIT/ROLLBACK buffering
 *
 * Statements outside a transaction commit immediately.
 * "EXISTS schema.table" returns a row iff the table exists.
 * "FIND <text>" returns one row per committed statement containing <text>.
 */
class MockConnection : public IDbConnection {
public:
    MockConnection(MockServer& server, std::string db)
        : server_(server), db_(std::move(db)) {}

    ~MockConnection() override { close(); }

    DbResultSet execute(const std::string& sql) override {
        if (!connected_) {
            return DbResultSet::failure("connection is closed");
        }

        const std::string upper = utils::to_upper(utils::trim(sql));
        DbResultSet ok;
        ok.success = true;

        if (upper == "BEGIN") {
            in_transaction_ = true;
            pending_.clear();
            return ok;
        }
        if (upper == "COMMIT") {
            server_.commit(db_, pending_);
            pending_.clear();
            in_transaction_ = false;
            return ok;
        }
        if (upper == "ROLLBACK") {
            pending_.clear();
            in_transaction_ = false;
            return ok;
        }
        if (upper == "SELECT 1") {
            ok.has_rows = true;
            ok.column_names = {"?column?"};
            ok.rows = {{"1"}};
            return ok;
        }
        if (upper.rfind("EXISTS ", 0) == 0) {
            const std::string target = utils::trim(sql.substr(7));
            const auto dot = target.find('.');
            ok.has_rows = true;
            if (server_.has_table(db_, target.substr(dot + 1))) {
                ok.rows = {{"1"}};
            }
            return ok;
        }
        if (upper.rfind("FIND ", 0) == 0) {
            const std::string needle = utils::trim(sql.substr(5));
            ok.has_rows = true;
            ok.column_names = {"statement"};
            for (const auto& stmt : server_.committed(db_)) {
                if (stmt.find(needle) != std::string::npos) {
                    ok.rows.push_back({stmt});
                }
            }
            return ok;
        }
        if (upper.rfind("CREATE DATABASE ", 0) == 0) {
            return server_.create_database(utils::trim(sql.substr(16)));
        }

        bool dropped = false;
        const std::string error = server_.check_statement(sql, dropped);
        if (dropped) {
            close();
            return DbResultSet::failure(error);
        }
        if (!error.empty()) {
            return DbResultSet::failure(error, "42000");
        }

        server_.note_statement();
        if (in_transaction_) {
            pending_.push_back(sql);
        } else {
            server_.commit(db_, {sql});
        }
        ok.affected_rows = 1;
        return ok;
    }

    bool is_healthy(const std::string& query) override {
        return connected_ && execute(query).success;
    }

    bool is_connected() const override { return connected_; }

    void close() override {
        if (connected_) {
            connected_ = false;
            pending_.clear();
            server_.connection_closed();
        }
    }

private:
    MockServer& server_;
    std::string db_;
    bool connected_ = true;
    bool in_transaction_ = false;
    std::vector<std::string> pending_;
};

inline ConnectResult MockServer::connect(const std::string& db) {
    connect_attempts_.fetch_add(1);

    std::chrono::milliseconds delay;
    {
        std::lock_guard lock(mutex_);
        delay = connect_delay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    {
        std::lock_guard lock(mutex_);
        if (failing_connects_ > 0) {
            --failing_connects_;
            return ConnectResult::error(connect_failure_, connect_failure_message_);
        }
        if (!database_exists(db)) {
            return ConnectResult::error(ConnectFailure::DATABASE_MISSING,
                "FATAL:  database \"" + db + "\" does not exist");
        }
    }

    successful_connects_.fetch_add(1);
    open_connections_.fetch_add(1);
    return ConnectResult::success(std::make_unique<MockConnection>(*this, db));
}

class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(MockServer& server) : server_(server) {}

    ConnectResult connect(const std::string& connection_string) override {
        // "dbname=<name>"
        return server_.connect(connection_string.substr(7));
    }

private:
    MockServer& server_;
};

/**
 * @brief Backend wired to a MockServer
 */
class MockBackend : public IDbBackend {
public:
    explicit MockBackend(MockServer& server)
        : factory_(std::make_shared<MockConnectionFactory>(server)) {}

    [[nodiscard]] DatabaseType type() const override { return DatabaseType::POSTGRESQL; }

    [[nodiscard]] std::shared_ptr<IConnectionFactory> connection_factory() override {
        return factory_;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name, const PoolConfig& config,
        std::unique_ptr<IDbConnection> seed = nullptr) override {
        return std::make_shared<GenericConnectionPool>(db_name, config, factory_, std::move(seed));
    }

    [[nodiscard]] std::string build_connection_string(
        const ConnectionSettings&, const std::string& database) const override {
        return "dbname=" + database;
    }

    [[nodiscard]] std::string create_database_statement(const std::string& database) const override {
        return "CREATE DATABASE " + database;
    }

    [[nodiscard]] bool is_duplicate_database(const DbResultSet& result) const override {
        return !result.success && result.sql_state == "42P04";
    }

    [[nodiscard]] std::string table_exists_query(
        const std::string& schema, const std::string& table) const override {
        return "EXISTS " + schema + "." + table;
    }

private:
    std::shared_ptr<IConnectionFactory> factory_;
};

/**
 * @brief Settings that pass descriptor validation, with no backoff delays
 */
inline ConnectionSettings test_settings() {
    ConnectionSettings s;
    s.host = "db.test";
    s.port = 5432;
    s.username = "app";
    s.password = "secret";
    s.retry.max_retries = 3;
    s.retry.backoff = BackoffKind::FIXED;
    s.retry.initial_backoff = std::chrono::milliseconds(1);
    s.retry.max_backoff = std::chrono::milliseconds(1);
    s.pool.acquire_timeout = std::chrono::milliseconds(1000);
    return s;
}

} // namespace sqlsession::testing
