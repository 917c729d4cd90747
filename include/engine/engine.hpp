#pragma once

#include "db/idb_backend.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sqlsession {

/**
 * @brief Outcome of a statement batch run inside one transaction
 */
struct BatchResult {
    bool success = true;
    size_t failed_index = 0;        // 0-based index of the failing statement
    std::string error_message;
    std::string sql_state;
};

/**
 * @brief Live, poolable handle for one resolved database
 *
 * Owned by EngineFactory (cached) and shared with the sessions that use it.
 * Disposing drains the pool; the destructor disposes.
 */
class Engine {
public:
    Engine(std::string database,
           std::string key,
           std::shared_ptr<IConnectionPool> pool,
           std::shared_ptr<IDbBackend> backend,
           std::chrono::milliseconds acquire_timeout);

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Check out a connection
     * @throws SessionError if the engine was disposed
     * @throws ConnectionError if no connection could be acquired in time
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> connect();

    /**
     * @brief Run statements as BEGIN; ...; COMMIT on one connection
     *
     * On the first failing statement the batch is rolled back and the
     * failure reported; nothing is thrown for SQL errors.
     */
    [[nodiscard]] BatchResult run_batch(const std::vector<std::string>& statements);

    void dispose();
    [[nodiscard]] bool disposed() const { return disposed_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& database() const { return database_; }
    [[nodiscard]] const std::string& key() const { return key_; }
    [[nodiscard]] IDbBackend& backend() { return *backend_; }
    [[nodiscard]] PoolStats stats() const { return pool_->get_stats(); }

private:
    std::string database_;
    std::string key_;
    std::shared_ptr<IConnectionPool> pool_;
    std::shared_ptr<IDbBackend> backend_;
    std::chrono::milliseconds acquire_timeout_;
    std::atomic<bool> disposed_{false};
};

} // namespace sqlsession
