#include "engine/engine.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlsession {

Engine::Engine(std::string database,
               std::string key,
               std::shared_ptr<IConnectionPool> pool,
               std::shared_ptr<IDbBackend> backend,
               std::chrono::milliseconds acquire_timeout)
    : database_(std::move(database)),
      key_(std::move(key)),
      pool_(std::move(pool)),
      backend_(std::move(backend)),
      acquire_timeout_(acquire_timeout) {}

Engine::~Engine() {
    dispose();
}

std::unique_ptr<PooledConnection> Engine::connect() {
    if (disposed()) {
        throw SessionError(std::format("Engine for database '{}' has been disposed", database_),
                           OrchestrationState::CLOSED);
    }

    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        const std::string cause = std::format(
            "no connection available within {}ms", acquire_timeout_.count());
        throw ConnectionError(
            std::format("Failed to acquire connection for database '{}': {}", database_, cause),
            cause, 1, true);
    }
    return conn;
}

BatchResult Engine::run_batch(const std::vector<std::string>& statements) {
    BatchResult result;
    if (statements.empty()) {
        return result;
    }

    auto conn = connect();

    auto begin = conn->get()->execute("BEGIN");
    if (!begin.success) {
        result.success = false;
        result.error_message = std::move(begin.error_message);
        result.sql_state = std::move(begin.sql_state);
        return result;
    }

    for (size_t i = 0; i < statements.size(); ++i) {
        auto r = conn->get()->execute(statements[i]);
        if (!r.success) {
            result.success = false;
            result.failed_index = i;
            result.error_message = std::move(r.error_message);
            result.sql_state = std::move(r.sql_state);

            const auto rb = conn->get()->execute("ROLLBACK");
            if (!rb.success) {
                utils::log::warn(std::format("Rollback failed on database '{}': {}",
                    database_, rb.error_message));
                conn->invalidate();
            }
            return result;
        }
    }

    auto commit = conn->get()->execute("COMMIT");
    if (!commit.success) {
        result.success = false;
        result.failed_index = statements.size();
        result.error_message = std::move(commit.error_message);
        result.sql_state = std::move(commit.sql_state);
    }
    return result;
}

void Engine::dispose() {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    pool_->drain();
    utils::log::debug(std::format("Engine disposed: {}", key_));
}

} // namespace sqlsession
