#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlsession {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory,
    std::unique_ptr<IDbConnection> seed)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    if (seed) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        if (config_.reuse_connections) {
            std::lock_guard lock(mutex_);
            track_new(seed.get());
            idle_connections_.emplace_back(std::move(seed));
        } else {
            seed->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    // Pre-warm up to min_connections (pooled mode only)
    if (config_.reuse_connections) {
        while (total_connections_.load(std::memory_order_relaxed) < config_.min_connections) {
            auto conn = create_connection();
            if (!conn) {
                utils::log::warn(std::format(
                    "Failed to pre-warm connection {} for database '{}'",
                    total_connections_.load() + 1, db_name_));
                break;
            }
            std::lock_guard lock(mutex_);
            track_new(conn.get());
            idle_connections_.emplace_back(std::move(conn));
        }
    }

    utils::log::info(std::format(
        "Pool ready for database '{}': {} open (min={}, max={}, reuse={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections,
        utils::booltostr(config_.reuse_connections)));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // drain() may have run while we waited
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.back());
            idle_connections_.pop_back();
            if (const auto it = lifetimes_.find(conn.get()); it != lifetimes_.end()) {
                birth = it->second.created;
                last_used = it->second.last_used;
            }
        }
    }

    const auto replace = [this](std::unique_ptr<IDbConnection>& c) {
        {
            std::lock_guard lock(mutex_);
            forget(c.get());
        }
        c->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
        c = create_connection();
        if (c) {
            std::lock_guard lock(mutex_);
            track_new(c.get());
        }
    };

    if (!conn) {
        conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            track_new(conn.get());
        }
    } else {
        const auto now = std::chrono::steady_clock::now();
        if (config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            replace(conn);
        } else if (now - last_used > config_.idle_timeout &&
                   !conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            replace(conn);
        }
    }

    if (!conn) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c) {
        this->return_connection(std::move(c));
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_discarded = connections_discarded_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();
    lifetimes_.clear();

    utils::log::info(std::format("Pool drained for database '{}'", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto result = factory_->connect(config_.connection_string);
    if (!result.ok()) {
        utils::log::warn(std::format("Connection to '{}' failed ({}): {}",
            db_name_, connect_failure_to_string(result.failure), result.error_message));
        return nullptr;
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return std::move(result.connection);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    // Closed on shutdown, when reuse is off, or when the connection is broken
    const bool broken = !conn->is_connected();
    if (shutdown_.load(std::memory_order_acquire) || !config_.reuse_connections || broken) {
        {
            std::lock_guard lock(mutex_);
            forget(conn.get());
        }
        conn->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
        if (broken) {
            connections_discarded_.fetch_add(1, std::memory_order_relaxed);
        }
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        lifetimes_[conn.get()].last_used = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

void GenericConnectionPool::track_new(IDbConnection* conn) {
    const auto now = std::chrono::steady_clock::now();
    lifetimes_[conn] = Lifetime{now, now};
}

void GenericConnectionPool::forget(IDbConnection* conn) {
    lifetimes_.erase(conn);
}

} // namespace sqlsession
