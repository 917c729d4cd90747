#include "db/pooled_connection.hpp"
#include <utility>

namespace sqlsession {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, Releaser release)
    : conn_(std::move(conn)), release_(std::move(release)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)), release_(std::exchange(other.release_, nullptr)) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        conn_ = std::move(other.conn_);
        release_ = std::exchange(other.release_, nullptr);
    }
    return *this;
}

void PooledConnection::release() {
    if (conn_ && release_) {
        release_(std::move(conn_));
    }
    conn_.reset();
}

void PooledConnection::invalidate() {
    if (conn_) {
        conn_->close();
    }
}

} // namespace sqlsession
