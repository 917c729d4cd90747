#pragma once

#include "db/idb_connection.hpp"
#include <string>

namespace sqlsession {

/**
 * @brief Minimal session capability handed to manual hooks
 *
 * execute() opens a transaction lazily; commit()/rollback() end it.
 * Statement failures throw SessionError.
 */
class ISession {
public:
    virtual ~ISession() = default;

    virtual DbResultSet execute(const std::string& sql) = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

} // namespace sqlsession
