#include "schema/schema_materializer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <mutex>

namespace sqlsession {

DeclaredSchemaMaterializer::DeclaredSchemaMaterializer(std::string schema)
    : schema_(std::move(schema)) {}

void DeclaredSchemaMaterializer::declare_table(const std::string& database, TableDefinition table) {
    if (database.empty()) {
        throw ConfigurationError("Table declared without a database name");
    }
    if (table.name.empty() || table.ddl.empty()) {
        throw ConfigurationError(std::format(
            "Table for database '{}' needs both a name and a DDL statement", database));
    }
    std::unique_lock lock(mutex_);
    tables_[database].push_back(std::move(table));
}

std::vector<TableDefinition> DeclaredSchemaMaterializer::tables(const std::string& database) const {
    std::shared_lock lock(mutex_);
    const auto it = tables_.find(database);
    return it == tables_.end() ? std::vector<TableDefinition>{} : it->second;
}

void DeclaredSchemaMaterializer::materialize(Engine& engine, const std::string& database) {
    const auto declared = tables(database);
    if (declared.empty()) {
        return;
    }

    auto conn = engine.connect();
    size_t created = 0;

    for (const auto& table : declared) {
        const auto exists = conn->get()->execute(
            engine.backend().table_exists_query(schema_, table.name));
        if (!exists.success) {
            throw SchemaError(engine.database(), std::format(
                "Could not inspect table '{}' in database '{}': {}",
                table.name, engine.database(), exists.error_message));
        }
        if (!exists.rows.empty()) {
            continue;
        }

        const auto result = conn->get()->execute(table.ddl);
        if (!result.success) {
            throw SchemaError(engine.database(), std::format(
                "Failed to create table '{}' in database '{}': {}",
                table.name, engine.database(), result.error_message));
        }
        ++created;
    }

    tables_created_.fetch_add(created, std::memory_order_relaxed);
    utils::log::info(std::format("Schema ready for database '{}': {} declared, {} created",
        engine.database(), declared.size(), created));
}

} // namespace sqlsession
