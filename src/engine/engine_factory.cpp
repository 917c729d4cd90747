#include "engine/engine_factory.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include <condition_variable>
#include <format>
#include <vector>

namespace sqlsession {

namespace {

constexpr auto kWaitPollInterval = std::chrono::milliseconds(20);

} // namespace

EngineFactory::EngineFactory(ConnectionDescriptor descriptor,
                             std::shared_ptr<IDbBackend> backend,
                             std::shared_ptr<IBackoffPolicy> backoff)
    : descriptor_(std::move(descriptor)),
      backend_(std::move(backend)),
      backoff_(std::move(backoff)),
      resolver_(descriptor_.settings().tenant_separator) {

    if (!backend_) {
        backend_ = BackendRegistry::instance().create(descriptor_.backend());
    }
    if (!backoff_) {
        backoff_ = make_backoff_policy(descriptor_.retry());
    }
}

EngineFactory::~EngineFactory() {
    dispose_all();
}

std::string EngineFactory::cache_key(const std::string& resolved) const {
    return descriptor_.target() + "/" + resolved;
}

std::shared_ptr<Engine> EngineFactory::get_or_create(
    const std::string& database,
    const TenantId& tenant,
    const Initializer& initializer,
    std::stop_token stop) {

    return get_or_create_resolved(resolve_name(database, tenant), initializer, stop);
}

std::shared_ptr<Engine> EngineFactory::find_cached(const std::string& resolved) const {
    std::lock_guard lock(mutex_);
    const auto it = engines_.find(cache_key(resolved));
    return it != engines_.end() ? it->second : nullptr;
}

std::shared_ptr<Engine> EngineFactory::get_or_create_resolved(
    const std::string& resolved,
    const Initializer& initializer,
    std::stop_token stop) {

    const std::string key = cache_key(resolved);
    const bool persistent = descriptor_.settings().persistent_engines;

    std::promise<std::shared_ptr<Engine>> promise;
    std::shared_future<std::shared_ptr<Engine>> pending;
    bool winner = false;

    {
        std::lock_guard lock(mutex_);
        if (persistent) {
            if (const auto it = engines_.find(key); it != engines_.end()) {
                cache_hits_.fetch_add(1, std::memory_order_relaxed);
                return it->second;
            }
        }
        if (const auto it = in_flight_.find(key); it != in_flight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            in_flight_.emplace(key, pending);
            winner = true;
        }
    }

    if (!winner) {
        shared_waits_.fetch_add(1, std::memory_order_relaxed);
        while (pending.wait_for(kWaitPollInterval) != std::future_status::ready) {
            if (stop.stop_requested()) {
                throw CancelledError(OrchestrationState::IDLE, std::format(
                    "Cancelled while waiting for engine '{}'", resolved));
            }
        }
        return pending.get();
    }

    try {
        auto engine = create_engine(resolved, key, stop);
        if (initializer) {
            initializer(engine);
        }
        {
            std::lock_guard lock(mutex_);
            if (persistent) {
                engines_[key] = engine;
            }
            in_flight_.erase(key);
        }
        engines_created_.fetch_add(1, std::memory_order_relaxed);
        promise.set_value(engine);
        return engine;
    } catch (...) {
        {
            std::lock_guard lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::shared_ptr<Engine> EngineFactory::create_engine(const std::string& resolved,
                                                     const std::string& key,
                                                     std::stop_token stop) {
    auto seed = connect_with_retry(resolved, stop);

    const auto& settings = descriptor_.settings();
    const auto& pool = settings.pool;

    PoolConfig config;
    config.connection_string = backend_->build_connection_string(settings, resolved);
    config.reuse_connections = pool.enabled;
    config.min_connections = pool.min_connections;
    config.max_connections = pool.max_connections;
    config.idle_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(pool.idle_timeout);
    config.health_check_query = pool.health_check_query;
    config.max_lifetime = pool.recycle;

    auto conn_pool = backend_->create_pool(resolved, config, std::move(seed));

    utils::log::debug(std::format("Engine created: {} (pooling={}, persistent={})",
        key, utils::booltostr(pool.enabled), utils::booltostr(settings.persistent_engines)));

    return std::make_shared<Engine>(resolved, key, std::move(conn_pool), backend_,
                                    pool.acquire_timeout);
}

std::unique_ptr<IDbConnection> EngineFactory::connect_with_retry(const std::string& resolved,
                                                                 std::stop_token stop) {
    connection_sequences_.fetch_add(1, std::memory_order_relaxed);

    const auto& settings = descriptor_.settings();
    const std::string conn_str = backend_->build_connection_string(settings, resolved);
    auto factory = backend_->connection_factory();

    uint32_t budget = descriptor_.max_attempts();
    uint32_t attempts = 0;
    bool database_created = false;
    std::string last_cause;

    while (attempts < budget) {
        if (stop.stop_requested()) {
            throw CancelledError(OrchestrationState::IDLE, std::format(
                "Cancelled while connecting to database '{}' after {} attempts",
                resolved, attempts));
        }

        ++attempts;
        connection_attempts_.fetch_add(1, std::memory_order_relaxed);

        auto result = factory->connect(conn_str);

        if (result.ok()) {
            if (result.connection->is_healthy(settings.pool.health_check_query)) {
                if (attempts > 1) {
                    utils::log::info(std::format("Connected to database '{}' on attempt {}",
                        resolved, attempts));
                }
                return std::move(result.connection);
            }
            result.connection->close();
            last_cause = "connection health check failed";
        } else {
            last_cause = result.error_message;

            switch (result.failure) {
                case ConnectFailure::DATABASE_MISSING:
                    if (settings.auto_create_database && !database_created) {
                        create_database(resolved, attempts);
                        database_created = true;
                        // The reconnect after creation does not consume the retry budget
                        ++budget;
                        continue;
                    }
                    [[fallthrough]];
                case ConnectFailure::AUTHENTICATION:
                case ConnectFailure::INVALID_TARGET:
                    utils::log::error(std::format(
                        "Connection to database '{}' failed ({}), not retrying: {}",
                        resolved, connect_failure_to_string(result.failure), last_cause));
                    throw ConnectionError(
                        std::format("Could not connect to database '{}': {}", resolved, last_cause),
                        last_cause, attempts, false);
                case ConnectFailure::TRANSIENT:
                case ConnectFailure::NONE:
                default:
                    break;
            }
        }

        if (attempts < budget) {
            const auto delay = backoff_->delay(attempts);
            utils::log::info(std::format(
                "Connection attempt {}/{} to database '{}' failed: {}; retrying in {}ms",
                attempts, budget, resolved, last_cause, delay.count()));
            interruptible_sleep(delay, stop, resolved);
        }
    }

    utils::log::error(std::format("Giving up on database '{}' after {} attempts: {}",
        resolved, attempts, last_cause));
    throw ConnectionError(
        std::format("Could not connect to database '{}' after {} attempts: {}",
                    resolved, attempts, last_cause),
        last_cause, attempts, true);
}

void EngineFactory::create_database(const std::string& resolved, uint32_t attempts) {
    const auto& settings = descriptor_.settings();
    const std::string maintenance = backend_->build_connection_string(
        settings, settings.maintenance_database);

    auto result = backend_->connection_factory()->connect(maintenance);
    if (!result.ok()) {
        throw ConnectionError(
            std::format("Could not reach maintenance database '{}' to create '{}': {}",
                        settings.maintenance_database, resolved, result.error_message),
            result.error_message, attempts, result.failure == ConnectFailure::TRANSIENT);
    }

    const auto created = result.connection->execute(backend_->create_database_statement(resolved));
    result.connection->close();

    if (created.success) {
        databases_created_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("Created database '{}'", resolved));
        return;
    }
    if (backend_->is_duplicate_database(created)) {
        utils::log::info(std::format("Database '{}' was created concurrently", resolved));
        return;
    }
    throw ConnectionError(
        std::format("Failed to create database '{}': {}", resolved, created.error_message),
        created.error_message, attempts, false);
}

void EngineFactory::interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop,
                                        const std::string& resolved) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    if (stop.stop_requested()) {
        throw CancelledError(OrchestrationState::IDLE, std::format(
            "Cancelled while backing off before reconnecting to database '{}'", resolved));
    }
}

bool EngineFactory::dispose(const std::string& database, const TenantId& tenant) {
    std::shared_ptr<Engine> engine;
    {
        std::lock_guard lock(mutex_);
        const auto it = engines_.find(cache_key(resolve_name(database, tenant)));
        if (it == engines_.end()) {
            return false;
        }
        engine = std::move(it->second);
        engines_.erase(it);
    }
    engine->dispose();
    return true;
}

void EngineFactory::dispose_all() {
    std::vector<std::shared_ptr<Engine>> engines;
    {
        std::lock_guard lock(mutex_);
        engines.reserve(engines_.size());
        for (auto& [key, engine] : engines_) {
            engines.push_back(std::move(engine));
        }
        engines_.clear();
    }
    for (auto& engine : engines) {
        engine->dispose();
    }
    if (!engines.empty()) {
        utils::log::info(std::format("Disposed {} engines", engines.size()));
    }
}

size_t EngineFactory::cached_engines() const {
    std::lock_guard lock(mutex_);
    return engines_.size();
}

EngineFactoryStats EngineFactory::stats() const {
    EngineFactoryStats s;
    s.engines_created = engines_created_.load(std::memory_order_relaxed);
    s.connection_sequences = connection_sequences_.load(std::memory_order_relaxed);
    s.connection_attempts = connection_attempts_.load(std::memory_order_relaxed);
    s.databases_created = databases_created_.load(std::memory_order_relaxed);
    s.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    s.shared_waits = shared_waits_.load(std::memory_order_relaxed);
    return s;
}

} // namespace sqlsession
