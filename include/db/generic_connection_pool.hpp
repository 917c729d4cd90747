#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace sqlsession {

/**
 * @brief Bounded connection pool behind every engine
 *
 * - At most max_connections checked out at once (counting_semaphore).
 * - Connections are opened on demand; min_connections are opened up front.
 * - The most recently returned idle connection is handed out first.
 * - An idle connection unused for idle_timeout is pinged before reuse.
 * - A connection older than max_lifetime is replaced on checkout.
 * - With reuse_connections=false every release closes the connection.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param db_name Resolved database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory
     * @param seed Already-verified connection to start the idle list with
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory,
        std::unique_ptr<IDbConnection> seed = nullptr);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn);

    void track_new(IDbConnection* conn);
    void forget(IDbConnection* conn);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage (back = most recently returned)
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> connections_discarded_{0};

    std::atomic<bool> shutdown_{false};

    struct Lifetime {
        std::chrono::steady_clock::time_point created;
        std::chrono::steady_clock::time_point last_used;
    };

    // Keyed by connection, guarded by mutex_
    std::unordered_map<IDbConnection*, Lifetime> lifetimes_;
};

} // namespace sqlsession
