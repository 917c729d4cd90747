#pragma once

#include "config/config_types.hpp"
#include "engine/engine.hpp"
#include <atomic>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlsession {

/**
 * @brief Creates the declared tables of a database if absent
 *
 * Must be idempotent: existing tables are left alone.
 * Irrecoverable DDL failures throw SchemaError.
 */
class ISchemaMaterializer {
public:
    virtual ~ISchemaMaterializer() = default;

    /**
     * @param engine Engine bound to the resolved (tenant-qualified) database
     * @param database Logical database name the tables were declared for
     */
    virtual void materialize(Engine& engine, const std::string& database) = 0;
};

/**
 * @brief Materializer for databases without declared tables
 */
class NullSchemaMaterializer : public ISchemaMaterializer {
public:
    void materialize(Engine&, const std::string&) override {}
};

/**
 * @brief Creates tables declared per logical database
 *
 * Each table is checked for existence in the default schema and its DDL
 * executed only when missing, in declaration order, one statement per
 * table (autocommit).
 */
class DeclaredSchemaMaterializer : public ISchemaMaterializer {
public:
    explicit DeclaredSchemaMaterializer(std::string schema = "public");

    /**
     * @throws ConfigurationError on an empty database, table name, or DDL
     */
    void declare_table(const std::string& database, TableDefinition table);

    [[nodiscard]] std::vector<TableDefinition> tables(const std::string& database) const;

    void materialize(Engine& engine, const std::string& database) override;

    [[nodiscard]] size_t tables_created() const {
        return tables_created_.load(std::memory_order_relaxed);
    }

private:
    std::string schema_;
    std::unordered_map<std::string, std::vector<TableDefinition>> tables_;
    mutable std::shared_mutex mutex_;
    std::atomic<size_t> tables_created_{0};
};

} // namespace sqlsession
