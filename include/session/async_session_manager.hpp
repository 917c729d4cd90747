#pragma once

#include "session/session_manager.hpp"
#include <future>
#include <memory>
#include <type_traits>

namespace sqlsession {

/**
 * @brief Non-blocking front end over SessionManager
 *
 * Same contract and ordering as SessionManager; connection establishment,
 * hook execution and materialization run on a worker (std::async) and the
 * caller receives a std::future. A request whose engine is already cached
 * completes synchronously with a ready future.
 *
 * Each uncached request holds one std::async thread for its whole
 * provisioning run, blocking on connects and hooks. Requests that wait on
 * another request's engine block their worker too, checking the stop
 * token every 20 ms. There is no thread cap; bound concurrency upstream.
 *
 * Futures returned from get_session/get_engine share ownership of the
 * underlying manager, so the manager outlives pending requests.
 */
class AsyncSessionManager {
public:
    AsyncSessionManager(ConnectionDescriptor descriptor,
                        std::shared_ptr<HookRegistry> hooks,
                        std::shared_ptr<ISchemaMaterializer> materializer = nullptr,
                        std::shared_ptr<IDbBackend> backend = nullptr,
                        std::shared_ptr<IBackoffPolicy> backoff = nullptr);

    explicit AsyncSessionManager(std::shared_ptr<SessionManager> manager);

    [[nodiscard]] std::future<Session> get_session(const std::string& database,
                                                   const TenantId& tenant = std::nullopt,
                                                   std::stop_token stop = {},
                                                   const RequestOptions& options = {});

    [[nodiscard]] std::future<std::shared_ptr<Engine>> get_engine(
        const std::string& database,
        const TenantId& tenant = std::nullopt,
        std::stop_token stop = {});

    /**
     * @brief Async run_in_session; fn runs on the worker
     */
    template <typename Fn>
    [[nodiscard]] auto run_in_session(const std::string& database, const TenantId& tenant, Fn fn)
        -> std::future<std::invoke_result_t<Fn&, Session&>> {
        auto manager = manager_;
        return std::async(std::launch::async,
            [manager, database, tenant, fn = std::move(fn)]() mutable {
                return manager->run_in_session(database, tenant, fn);
            });
    }

    [[nodiscard]] SessionManager& manager() { return *manager_; }

private:
    std::shared_ptr<SessionManager> manager_;
};

} // namespace sqlsession
