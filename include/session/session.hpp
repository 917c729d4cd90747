#pragma once

#include "engine/backoff_policy.hpp"
#include "engine/engine.hpp"
#include "session/isession.hpp"
#include "tenant/tenant_resolver.hpp"
#include <functional>
#include <memory>
#include <string>

namespace sqlsession {

struct SessionOptions {
    // Re-run a statement whose connection was dropped, only while it is the
    // first statement of the current transaction
    bool retry_statements = false;
    int max_statement_retries = 3;
    std::shared_ptr<IBackoffPolicy> retry_backoff;   // null = no wait between retries

    // Invoked once when the session is closed
    std::function<void()> on_close;
};

/**
 * @brief Unit of work bound to one engine
 *
 * - Connection checked out on first use, returned after commit/rollback.
 * - Transaction begun implicitly by the first execute().
 * - close() rolls back an open transaction; the destructor closes.
 * - Any use after close throws SessionError.
 *
 * Move-only. The engine stays alive as long as a session references it.
 */
class Session : public ISession {
public:
    Session(std::shared_ptr<Engine> engine, TenantId tenant, SessionOptions options = {});
    ~Session() override;

    Session(Session&& other) noexcept;
    Session& operator=(Session&&) = delete;
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @throws SessionError on statement failure or use after close
     */
    DbResultSet execute(const std::string& sql) override;

    /** @throws SessionError if COMMIT fails (the transaction is gone either way) */
    void commit() override;

    void rollback() override;

    void close();

    [[nodiscard]] bool is_closed() const { return closed_; }
    [[nodiscard]] bool in_transaction() const { return in_transaction_; }
    [[nodiscard]] const TenantId& tenant_id() const { return tenant_; }

    /** @brief Resolved database name */
    [[nodiscard]] const std::string& database() const;

    [[nodiscard]] std::shared_ptr<Engine> engine() const { return engine_; }

private:
    void ensure_open() const;
    DbResultSet run(const std::string& sql);
    void release_connection();
    bool end_transaction(const char* statement);

    std::shared_ptr<Engine> engine_;
    TenantId tenant_;
    SessionOptions options_;
    std::string database_;
    std::unique_ptr<PooledConnection> conn_;
    bool in_transaction_ = false;
    size_t statements_in_transaction_ = 0;
    bool closed_ = false;
};

} // namespace sqlsession
