#include "core/utils.hpp"
#include "core/error.hpp"
#include "config/config_loader.hpp"
#include "config/connection_descriptor.hpp"
#include "db/backend_registry.hpp"
#include "hooks/hook_registry.hpp"
#include "schema/schema_materializer.hpp"
#include "session/session_manager.hpp"

// Force-link backends (auto-register via static init)
#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <stop_token>

using namespace sqlsession;
using json = nlohmann::json;

namespace {

std::stop_source g_stop;

// =========================================================================
// Explicit Backend Registration (ensures linker includes backend objects)
// =========================================================================

void register_backends() {
    #ifdef ENABLE_POSTGRESQL
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    #endif
}

void signal_handler(int signal) {
    // Pending hooks stop before the next one starts
    g_stop.request_stop();
    std::signal(signal, SIG_DFL);
}

json pool_stats_json(const PoolStats& stats) {
    return json{
        {"total_connections", stats.total_connections},
        {"idle_connections", stats.idle_connections},
        {"active_connections", stats.active_connections},
        {"total_acquires", stats.total_acquires},
        {"failed_acquires", stats.failed_acquires},
        {"connections_recycled", stats.connections_recycled},
        {"connections_discarded", stats.connections_discarded},
    };
}

void register_provisioning(const DatabaseProvisioning& db, HookRegistry& hooks,
                           DeclaredSchemaMaterializer& materializer) {
    if (!db.precreate.empty()) {
        const auto statements = db.precreate;
        hooks.register_precreate(db.name,
            [statements](const TenantId&) { return statements; }, "config precreate");
    }
    if (!db.postcreate.empty()) {
        const auto statements = db.postcreate;
        hooks.register_postcreate(db.name,
            [statements](const TenantId&) { return statements; }, "config postcreate");
    }
    for (const auto& table : db.tables) {
        materializer.declare_table(db.name, table);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    register_backends();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Configuration: TOML file when given, environment otherwise
    ConfigLoader::LoadResult loaded;
    if (argc > 1) {
        utils::log::info(std::format("Loading configuration from {}", argv[1]));
        loaded = ConfigLoader::load_from_file(argv[1]);
    } else {
        utils::log::info("Loading configuration from environment");
        loaded = ConfigLoader::load_from_env();
    }

    if (!loaded.success) {
        utils::log::error(loaded.error_message);
        return EXIT_FAILURE;
    }

    SessionConfig config = std::move(loaded.config);
    utils::log::set_level(utils::log::parse_level(config.logging.level));

    json report;
    report["databases"] = json::array();
    bool failed = false;

    try {
        auto hooks = std::make_shared<HookRegistry>();
        auto materializer = std::make_shared<DeclaredSchemaMaterializer>(
            config.connection.default_schema);

        for (const auto& db : config.databases) {
            register_provisioning(db, *hooks, *materializer);
        }

        SessionManager manager(ConnectionDescriptor(config.connection), hooks, materializer);

        for (const auto& db : config.databases) {
            std::vector<TenantId> tenants;
            if (db.tenants.empty()) {
                tenants.emplace_back(std::nullopt);
            } else {
                tenants.assign(db.tenants.begin(), db.tenants.end());
            }

            for (const auto& tenant : tenants) {
                json entry{
                    {"database", db.name},
                    {"tenant", tenant ? json(*tenant) : json(nullptr)},
                    {"resolved", manager.resolve_name(db.name, tenant)},
                };

                try {
                    const auto engine = manager.get_engine(db.name, tenant, g_stop.get_token());
                    entry["status"] = "ready";
                    entry["pool"] = pool_stats_json(engine->stats());
                } catch (const SessionManagerError& e) {
                    failed = true;
                    entry["status"] = "failed";
                    entry["state"] = orchestration_state_to_string(e.state());
                    entry["error"] = e.what();
                    utils::log::error(std::format("Provisioning '{}' failed: {}",
                        entry["resolved"].get<std::string>(), e.what()));
                }

                report["databases"].push_back(std::move(entry));
            }
        }

        const auto stats = manager.engine_factory().stats();
        report["engines"] = json{
            {"created", stats.engines_created},
            {"connection_attempts", stats.connection_attempts},
            {"databases_created", stats.databases_created},
        };
    } catch (const ConfigurationError& e) {
        utils::log::error(std::format("Invalid configuration: {}", e.what()));
        return EXIT_FAILURE;
    }

    report["success"] = !failed;
    std::cout << report.dump(2) << std::endl;

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
