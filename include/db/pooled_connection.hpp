#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqlsession {

/**
 * @brief Checked-out connection; hands the connection back when destroyed
 *
 * A connection closed through invalidate() (or dropped by the server) is
 * still handed back; the pool sees it is no longer connected and discards it.
 */
class PooledConnection {
public:
    using Releaser = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, Releaser release);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ && conn_->is_connected(); }

    void invalidate();

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    Releaser release_;
};

} // namespace sqlsession
