#include "session/async_session_manager.hpp"
#include "core/error.hpp"

namespace sqlsession {

AsyncSessionManager::AsyncSessionManager(ConnectionDescriptor descriptor,
                                         std::shared_ptr<HookRegistry> hooks,
                                         std::shared_ptr<ISchemaMaterializer> materializer,
                                         std::shared_ptr<IDbBackend> backend,
                                         std::shared_ptr<IBackoffPolicy> backoff)
    : manager_(std::make_shared<SessionManager>(
          std::move(descriptor), std::move(hooks), std::move(materializer),
          std::move(backend), std::move(backoff))) {}

AsyncSessionManager::AsyncSessionManager(std::shared_ptr<SessionManager> manager)
    : manager_(std::move(manager)) {
    if (!manager_) {
        throw ConfigurationError("AsyncSessionManager requires a SessionManager");
    }
}

std::future<Session> AsyncSessionManager::get_session(const std::string& database,
                                                      const TenantId& tenant,
                                                      std::stop_token stop,
                                                      const RequestOptions& options) {
    if (!stop.stop_requested()) {
        // Fast path: cached engine, nothing to wait for
        if (auto session = manager_->try_cached_session(database, tenant, options)) {
            std::promise<Session> ready;
            ready.set_value(std::move(*session));
            return ready.get_future();
        }
    }

    auto manager = manager_;
    return std::async(std::launch::async, [manager, database, tenant, stop, options] {
        return manager->get_session(database, tenant, stop, options);
    });
}

std::future<std::shared_ptr<Engine>> AsyncSessionManager::get_engine(const std::string& database,
                                                                     const TenantId& tenant,
                                                                     std::stop_token stop) {
    auto manager = manager_;
    return std::async(std::launch::async, [manager, database, tenant, stop] {
        return manager->get_engine(database, tenant, stop);
    });
}

} // namespace sqlsession
