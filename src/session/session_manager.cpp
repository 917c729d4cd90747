#include "session/session_manager.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace sqlsession {

namespace {

// Keys this thread is currently provisioning, per manager
class ProvisioningScope {
public:
    ProvisioningScope(const SessionManager* owner, const std::string& resolved) {
        stack().emplace_back(owner, resolved);
    }
    ~ProvisioningScope() { stack().pop_back(); }

    ProvisioningScope(const ProvisioningScope&) = delete;
    ProvisioningScope& operator=(const ProvisioningScope&) = delete;

    static bool active(const SessionManager* owner, const std::string& resolved) {
        return std::find(stack().begin(), stack().end(),
                         std::pair<const SessionManager*, std::string>(owner, resolved))
               != stack().end();
    }

private:
    static std::vector<std::pair<const SessionManager*, std::string>>& stack() {
        thread_local std::vector<std::pair<const SessionManager*, std::string>> keys;
        return keys;
    }
};

} // namespace

SessionManager::SessionManager(ConnectionDescriptor descriptor,
                               std::shared_ptr<HookRegistry> hooks,
                               std::shared_ptr<ISchemaMaterializer> materializer,
                               std::shared_ptr<IDbBackend> backend,
                               std::shared_ptr<IBackoffPolicy> backoff)
    : factory_(std::move(descriptor), std::move(backend), std::move(backoff)),
      hooks_(hooks ? std::move(hooks) : std::make_shared<HookRegistry>()),
      materializer_(materializer ? std::move(materializer)
                                 : std::make_shared<NullSchemaMaterializer>()),
      observer_(std::make_shared<ObserverSlot>()) {
    // Statement retries wait 2^(n-1) x the configured base delay
    const auto& retry = factory_.descriptor().retry();
    statement_backoff_ = std::make_shared<ExponentialBackoff>(
        retry.initial_backoff, 2.0, retry.max_backoff);
}

SessionManager::~SessionManager() {
    factory_.dispose_all();
}

void SessionManager::ObserverSlot::notify(const std::string& resolved,
                                          OrchestrationState state) const {
    StateObserver current;
    {
        std::lock_guard lock(mutex);
        current = observer;
    }
    if (current) {
        current(resolved, state);
    }
}

void SessionManager::set_state_observer(StateObserver observer) {
    std::lock_guard lock(observer_->mutex);
    observer_->observer = std::move(observer);
}

void SessionManager::notify(const std::string& resolved, OrchestrationState state) const {
    observer_->notify(resolved, state);
}

// ============================================================================
// Entry points
// ============================================================================

Session SessionManager::get_session(const std::string& database,
                                    const TenantId& tenant,
                                    std::stop_token stop,
                                    const RequestOptions& options) {
    auto engine = obtain_engine(database, tenant, stop);
    if (stop.stop_requested()) {
        throw CancelledError(OrchestrationState::POSTCREATED, std::format(
            "Cancelled before opening a session on database '{}'", engine->database()));
    }
    return open_session(std::move(engine), tenant, options);
}

std::shared_ptr<Engine> SessionManager::get_engine(const std::string& database,
                                                   const TenantId& tenant,
                                                   std::stop_token stop) {
    return obtain_engine(database, tenant, stop);
}

std::optional<Session> SessionManager::try_cached_session(const std::string& database,
                                                          const TenantId& tenant,
                                                          const RequestOptions& options) {
    const std::string resolved = resolve_name(database, tenant);
    auto engine = factory_.find_cached(resolved);
    if (!engine || engine->disposed()) {
        return std::nullopt;
    }
    notify(resolved, OrchestrationState::IDLE);
    notify(resolved, OrchestrationState::ENGINE_READY);
    notify(resolved, OrchestrationState::PRECREATED);
    notify(resolved, OrchestrationState::SCHEMA_READY);
    notify(resolved, OrchestrationState::POSTCREATED);
    return open_session(std::move(engine), tenant, options);
}

// ============================================================================
// Orchestration
// ============================================================================

std::shared_ptr<Engine> SessionManager::obtain_engine(const std::string& database,
                                                      const TenantId& tenant,
                                                      std::stop_token stop) {
    const std::string resolved = resolve_name(database, tenant);
    notify(resolved, OrchestrationState::IDLE);

    if (stop.stop_requested()) {
        throw CancelledError(OrchestrationState::IDLE, std::format(
            "Cancelled before requesting engine for database '{}'", resolved));
    }
    if (ProvisioningScope::active(this, resolved)) {
        // A hook asking for the engine it is provisioning would wait on itself
        throw SessionError(std::format(
            "Database '{}' requested from a hook that is still provisioning it", resolved),
            OrchestrationState::IDLE);
    }

    bool provisioned_here = false;
    auto engine = factory_.get_or_create_resolved(
        resolved,
        [&](const std::shared_ptr<Engine>& created) {
            provisioned_here = true;
            provision(created, database, tenant, stop);
        },
        stop);

    if (!provisioned_here) {
        // Provisioned by an earlier (or concurrent) request for this key
        notify(resolved, OrchestrationState::ENGINE_READY);
        notify(resolved, OrchestrationState::PRECREATED);
        notify(resolved, OrchestrationState::SCHEMA_READY);
        notify(resolved, OrchestrationState::POSTCREATED);
    }
    return engine;
}

void SessionManager::provision(const std::shared_ptr<Engine>& engine,
                               const std::string& database,
                               const TenantId& tenant,
                               std::stop_token stop) {
    const std::string& resolved = engine->database();
    ProvisioningScope scope(this, resolved);
    notify(resolved, OrchestrationState::ENGINE_READY);

    run_hooks(HookKind::PRECREATE_AUTO, engine, database, tenant, stop,
              OrchestrationState::ENGINE_READY);
    run_hooks(HookKind::PRECREATE_MANUAL, engine, database, tenant, stop,
              OrchestrationState::ENGINE_READY);
    utils::log::info(std::format("Precreate phase complete for database '{}'", resolved));
    notify(resolved, OrchestrationState::PRECREATED);

    if (stop.stop_requested()) {
        throw CancelledError(OrchestrationState::PRECREATED, std::format(
            "Cancelled before materializing schema for database '{}'", resolved));
    }
    try {
        materializer_->materialize(*engine, database);
    } catch (const SchemaError&) {
        throw;
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Schema materialization failed for database '{}': {}",
                                      resolved, e.what()));
        throw SchemaError(resolved, std::format(
            "Schema materialization failed for database '{}': {}", resolved, e.what()));
    }
    notify(resolved, OrchestrationState::SCHEMA_READY);

    run_hooks(HookKind::POSTCREATE_AUTO, engine, database, tenant, stop,
              OrchestrationState::SCHEMA_READY);
    run_hooks(HookKind::POSTCREATE_MANUAL, engine, database, tenant, stop,
              OrchestrationState::SCHEMA_READY);
    utils::log::info(std::format("Postcreate phase complete for database '{}'", resolved));
    notify(resolved, OrchestrationState::POSTCREATED);
}

std::vector<HookEntry> SessionManager::hooks_for(HookKind kind,
                                                 const std::string& database,
                                                 const std::string& resolved) const {
    auto entries = hooks_->get(kind, database);
    if (resolved != database) {
        auto specific = hooks_->get(kind, resolved);
        entries.insert(entries.end(),
                       std::make_move_iterator(specific.begin()),
                       std::make_move_iterator(specific.end()));
    }
    return entries;
}

void SessionManager::run_hooks(HookKind kind,
                               const std::shared_ptr<Engine>& engine,
                               const std::string& database,
                               const TenantId& tenant,
                               std::stop_token stop,
                               OrchestrationState reached) {
    const std::string& resolved = engine->database();
    const auto entries = hooks_for(kind, database, resolved);

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        const size_t ordinal = i + 1;

        if (stop.stop_requested()) {
            throw CancelledError(reached, std::format(
                "Cancelled before {} hook #{} for database '{}'",
                hook_kind_to_string(kind), ordinal, resolved));
        }

        std::optional<std::string> cause;

        if (const auto* fn = std::get_if<AutoHook>(&entry.callable)) {
            try {
                const auto statements = (*fn)(tenant);
                if (statements.empty()) {
                    continue;
                }
                const auto batch = engine->run_batch(statements);
                if (!batch.success) {
                    cause = batch.failed_index < statements.size()
                        ? std::format("statement {} failed: {}",
                                      batch.failed_index + 1, batch.error_message)
                        : std::format("commit failed: {}", batch.error_message);
                }
            } catch (const std::exception& e) {
                cause = e.what();
            }
        } else {
            const auto& manual = std::get<ManualHook>(entry.callable);
            try {
                Session session(engine, tenant, session_options(resolved, {}, false));
                manual(session, tenant);
                if (!session.is_closed()) {
                    session.commit();
                }
            } catch (const std::exception& e) {
                cause = e.what();
            }
        }

        if (cause) {
            utils::log::error(std::format("{} hook #{} failed for database '{}' (tenant {}): {}",
                hook_kind_to_string(kind), ordinal, resolved, tenant_label(tenant), *cause));
            throw HookExecutionError(kind, resolved, ordinal, entry.label, *cause);
        }
    }
}

// ============================================================================
// Sessions
// ============================================================================

SessionOptions SessionManager::session_options(const std::string& resolved,
                                               const RequestOptions& options,
                                               bool notify_close) const {
    const auto& retry = factory_.descriptor().retry();

    SessionOptions opts;
    opts.retry_statements = options.retry_statements.value_or(retry.retry_statements);
    opts.max_statement_retries = retry.max_statement_retries;
    opts.retry_backoff = statement_backoff_;
    if (notify_close) {
        // Sessions may outlive the manager; the slot is shared
        opts.on_close = [slot = observer_, resolved] {
            slot->notify(resolved, OrchestrationState::CLOSED);
        };
    }
    return opts;
}

Session SessionManager::open_session(std::shared_ptr<Engine> engine,
                                     const TenantId& tenant,
                                     const RequestOptions& options) {
    const std::string resolved = engine->database();
    Session session(std::move(engine), tenant, session_options(resolved, options, true));
    notify(resolved, OrchestrationState::SESSION_ACTIVE);
    return session;
}

} // namespace sqlsession
