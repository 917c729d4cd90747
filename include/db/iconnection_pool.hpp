#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlsession {

class PooledConnection;

/**
 * @brief Pool settings derived from ConnectionSettings for one database
 */
struct PoolConfig {
    std::string connection_string;
    bool reuse_connections = true;                 // false = close on every release
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds idle_timeout{30000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{300};        // 0 = disabled
};

/**
 * @brief Counters reported by IConnectionPool::get_stats()
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
    size_t connections_discarded = 0;
};

/**
 * @brief Connection pool owned by an Engine
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Check out a connection, waiting up to timeout for a free slot
     * @return nullptr on timeout, connect failure, or after drain()
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close idle connections and refuse further checkouts
     *
     * Checked-out connections are closed when they come back. Idempotent.
     */
    virtual void drain() = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace sqlsession
