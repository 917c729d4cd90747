#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlsession {

/**
 * @brief Outcome of one statement, copied out of the native result
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sql_state;      // five-character SQLSTATE when the backend reports one

    bool has_rows = false;                          // statement returned a row set
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;
    uint64_t affected_rows = 0;

    static DbResultSet failure(std::string message, std::string state = {}) {
        DbResultSet r;
        r.success = false;
        r.error_message = std::move(message);
        r.sql_state = std::move(state);
        return r;
    }
};

/**
 * @brief One native connection
 *
 * Not thread-safe: a connection is used by one checkout at a time.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement verbatim
     * @return Result set with rows or affected count; SQL errors are reported
     *         through success=false, never thrown
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /** @brief Connected and able to run health_check_query */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /** @brief False once closed locally or dropped by the server */
    [[nodiscard]] virtual bool is_connected() const = 0;

    virtual void close() = 0;
};

} // namespace sqlsession
