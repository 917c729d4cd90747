#pragma once

#include "config/connection_descriptor.hpp"
#include "core/error.hpp"
#include "engine/engine_factory.hpp"
#include "hooks/hook_registry.hpp"
#include "schema/schema_materializer.hpp"
#include "session/session.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <type_traits>
#include <vector>

namespace sqlsession {

/**
 * @brief Per-request overrides
 */
struct RequestOptions {
    std::optional<bool> retry_statements;   // unset = connection settings decide
};

/** @brief Receives (resolved database, state) for every transition */
using StateObserver = std::function<void(const std::string&, OrchestrationState)>;

/**
 * @brief Session orchestrator
 *
 * For a (database, tenant) request:
 *   engine → precreate-auto → precreate-manual → materialize
 *          → postcreate-auto → postcreate-manual → session
 *
 * Provisioning runs once per resolved database, inside the engine
 * factory's single-flight, before the engine is published. Requests served
 * from the engine cache find those phases already satisfied and pass
 * straight through them.
 *
 * Hooks are looked up under the logical name, then under the resolved name
 * when a tenant qualifies it; ordinals count across that combined list.
 * Every hook is its own transaction. A failing hook stops the request with
 * HookExecutionError; earlier hooks stay committed.
 *
 * A stop request is honored before the engine step, before every hook, and
 * before materialization and session creation (CancelledError).
 */
class SessionManager {
public:
    SessionManager(ConnectionDescriptor descriptor,
                   std::shared_ptr<HookRegistry> hooks,
                   std::shared_ptr<ISchemaMaterializer> materializer = nullptr,
                   std::shared_ptr<IDbBackend> backend = nullptr,
                   std::shared_ptr<IBackoffPolicy> backoff = nullptr);

    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Provisioned engine plus a fresh session on it
     * @throws ConnectionError, HookExecutionError, SchemaError, CancelledError
     */
    [[nodiscard]] Session get_session(const std::string& database,
                                      const TenantId& tenant = std::nullopt,
                                      std::stop_token stop = {},
                                      const RequestOptions& options = {});

    /**
     * @brief Provisioned engine for raw access (no session)
     */
    [[nodiscard]] std::shared_ptr<Engine> get_engine(const std::string& database,
                                                     const TenantId& tenant = std::nullopt,
                                                     std::stop_token stop = {});

    /**
     * @brief Session for an already cached engine, without blocking
     * @return std::nullopt when the engine still has to be created
     */
    [[nodiscard]] std::optional<Session> try_cached_session(const std::string& database,
                                                            const TenantId& tenant = std::nullopt,
                                                            const RequestOptions& options = {});

    /**
     * @brief Run fn(session), commit on return; rollback on exception
     *
     * The session is closed on every path.
     */
    template <typename Fn>
    auto run_in_session(const std::string& database, const TenantId& tenant, Fn&& fn)
        -> std::invoke_result_t<Fn&, Session&> {
        auto session = get_session(database, tenant);
        if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Session&>>) {
            fn(session);
            session.commit();
            session.close();
        } else {
            auto result = fn(session);
            session.commit();
            session.close();
            return result;
        }
    }

    [[nodiscard]] std::string resolve_name(const std::string& database, const TenantId& tenant) const {
        return factory_.resolve_name(database, tenant);
    }

    void set_state_observer(StateObserver observer);

    bool dispose_engine(const std::string& database, const TenantId& tenant = std::nullopt) {
        return factory_.dispose(database, tenant);
    }

    void dispose_all() { factory_.dispose_all(); }

    [[nodiscard]] EngineFactory& engine_factory() { return factory_; }
    [[nodiscard]] HookRegistry& hooks() { return *hooks_; }
    [[nodiscard]] const ConnectionDescriptor& descriptor() const { return factory_.descriptor(); }

private:
    std::shared_ptr<Engine> obtain_engine(const std::string& database,
                                          const TenantId& tenant,
                                          std::stop_token stop);

    void provision(const std::shared_ptr<Engine>& engine,
                   const std::string& database,
                   const TenantId& tenant,
                   std::stop_token stop);

    void run_hooks(HookKind kind,
                   const std::shared_ptr<Engine>& engine,
                   const std::string& database,
                   const TenantId& tenant,
                   std::stop_token stop,
                   OrchestrationState reached);

    [[nodiscard]] std::vector<HookEntry> hooks_for(HookKind kind,
                                                   const std::string& database,
                                                   const std::string& resolved) const;

    [[nodiscard]] Session open_session(std::shared_ptr<Engine> engine,
                                       const TenantId& tenant,
                                       const RequestOptions& options);

    [[nodiscard]] SessionOptions session_options(const std::string& resolved,
                                                 const RequestOptions& options,
                                                 bool notify_close) const;

    void notify(const std::string& resolved, OrchestrationState state) const;

    EngineFactory factory_;
    std::shared_ptr<HookRegistry> hooks_;
    std::shared_ptr<ISchemaMaterializer> materializer_;
    std::shared_ptr<IBackoffPolicy> statement_backoff_;

    struct ObserverSlot {
        mutable std::mutex mutex;
        StateObserver observer;

        void notify(const std::string& resolved, OrchestrationState state) const;
    };

    std::shared_ptr<ObserverSlot> observer_;
};

} // namespace sqlsession
