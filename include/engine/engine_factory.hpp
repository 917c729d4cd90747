#pragma once

#include "config/connection_descriptor.hpp"
#include "db/idb_backend.hpp"
#include "engine/backoff_policy.hpp"
#include "engine/engine.hpp"
#include "tenant/tenant_resolver.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace sqlsession {

struct EngineFactoryStats {
    size_t engines_created = 0;       // engines published (cached or not)
    size_t connection_sequences = 0;  // retry loops started
    size_t connection_attempts = 0;   // individual connect calls
    size_t databases_created = 0;     // CREATE DATABASE that actually created
    size_t cache_hits = 0;
    size_t shared_waits = 0;          // callers that joined an in-flight creation
};

/**
 * @brief Produces (or reuses) engines for resolved database names
 *
 * Cache and single-flight:
 * - Engines are keyed by "host:port/<resolved name>".
 * - At most one creation runs per key; concurrent callers for the same key
 *   wait on the winner's shared_future and receive its engine or exception.
 * - The initializer runs inside the single-flight, after the connection is
 *   verified and before the engine is published, so it runs exactly once
 *   per published engine.
 * - A failed creation publishes nothing; the next request starts over.
 * - With persistent_engines=false nothing is cached (in-flight requests are
 *   still shared).
 *
 * Connection attempts:
 * - Up to max_retries + 1 attempts, sleeping backoff->delay(n) between them.
 * - Authentication and malformed-target failures abort immediately.
 * - A missing database is created once (auto_create_database) through the
 *   maintenance database; "already exists" counts as success.
 * - Each successful connection is verified with the health check query.
 */
class EngineFactory {
public:
    using Initializer = std::function<void(const std::shared_ptr<Engine>&)>;

    /**
     * @param backend Backend to use; when null, looked up in BackendRegistry
     * @param backoff Backoff between attempts; when null, built from the descriptor
     */
    explicit EngineFactory(ConnectionDescriptor descriptor,
                           std::shared_ptr<IDbBackend> backend = nullptr,
                           std::shared_ptr<IBackoffPolicy> backoff = nullptr);

    ~EngineFactory();

    EngineFactory(const EngineFactory&) = delete;
    EngineFactory& operator=(const EngineFactory&) = delete;

    /**
     * @brief Cached engine for (database, tenant), creating it if needed
     * @throws ConnectionError when the attempt sequence fails
     * @throws CancelledError when stop is requested while connecting or waiting
     * @throws anything the initializer throws (nothing is cached then)
     */
    [[nodiscard]] std::shared_ptr<Engine> get_or_create(
        const std::string& database,
        const TenantId& tenant,
        const Initializer& initializer = {},
        std::stop_token stop = {});

    /** @brief Same as get_or_create, for an already resolved name */
    [[nodiscard]] std::shared_ptr<Engine> get_or_create_resolved(
        const std::string& resolved,
        const Initializer& initializer = {},
        std::stop_token stop = {});

    /** @brief Cached engine, or nullptr (never connects) */
    [[nodiscard]] std::shared_ptr<Engine> find_cached(const std::string& resolved) const;

    [[nodiscard]] std::string resolve_name(const std::string& database, const TenantId& tenant) const {
        return resolver_.resolve(database, tenant);
    }

    [[nodiscard]] std::string cache_key(const std::string& resolved) const;

    /**
     * @brief Remove and drain the cached engine for (database, tenant)
     * @return true if an engine was cached
     */
    bool dispose(const std::string& database, const TenantId& tenant);

    void dispose_all();

    [[nodiscard]] size_t cached_engines() const;
    [[nodiscard]] EngineFactoryStats stats() const;

    [[nodiscard]] const ConnectionDescriptor& descriptor() const { return descriptor_; }
    [[nodiscard]] IDbBackend& backend() { return *backend_; }

private:
    std::shared_ptr<Engine> create_engine(const std::string& resolved,
                                          const std::string& key,
                                          std::stop_token stop);

    std::unique_ptr<IDbConnection> connect_with_retry(const std::string& resolved,
                                                      std::stop_token stop);

    void create_database(const std::string& resolved, uint32_t attempts);

    static void interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop,
                                    const std::string& resolved);

    ConnectionDescriptor descriptor_;
    std::shared_ptr<IDbBackend> backend_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    TenantResolver resolver_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Engine>> engines_;
    std::unordered_map<std::string, std::shared_future<std::shared_ptr<Engine>>> in_flight_;

    std::atomic<size_t> engines_created_{0};
    std::atomic<size_t> connection_sequences_{0};
    std::atomic<size_t> connection_attempts_{0};
    std::atomic<size_t> databases_created_{0};
    std::atomic<size_t> cache_hits_{0};
    std::atomic<size_t> shared_waits_{0};
};

} // namespace sqlsession
