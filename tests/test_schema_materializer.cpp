#include <catch2/catch_test_macros.hpp>
#include "schema/schema_materializer.hpp"
#include "engine/engine_factory.hpp"
#include "core/error.hpp"
#include "mocks/mock_backend.hpp"

using namespace sqlsession;
using namespace sqlsession::testing;

namespace {

struct Fixture {
    MockServer server;
    EngineFactory factory{ConnectionDescriptor(test_settings()),
                          std::make_shared<MockBackend>(server)};
};

} // namespace

TEST_CASE("DeclaredSchemaMaterializer: creates missing tables in order", "[schema]") {
    Fixture f;
    DeclaredSchemaMaterializer materializer;
    materializer.declare_table("orders", {"customers", "CREATE TABLE customers (id INT)"});
    materializer.declare_table("orders", {"orders", "CREATE TABLE orders (id INT)"});

    auto engine = f.factory.get_or_create("orders", "acme");
    materializer.materialize(*engine, "orders");

    REQUIRE(f.server.has_table("acme__orders", "customers"));
    REQUIRE(f.server.has_table("acme__orders", "orders"));
    const auto log = f.server.committed("acme__orders");
    REQUIRE(log.size() == 2);
    REQUIRE(log[0].find("customers") != std::string::npos);
    REQUIRE(materializer.tables_created() == 2);
}

TEST_CASE("DeclaredSchemaMaterializer: existing tables are left alone", "[schema]") {
    Fixture f;
    DeclaredSchemaMaterializer materializer;
    materializer.declare_table("orders", {"orders", "CREATE TABLE orders (id INT)"});

    auto engine = f.factory.get_or_create("orders", std::nullopt);
    materializer.materialize(*engine, "orders");
    materializer.materialize(*engine, "orders");

    REQUIRE(f.server.count_committed("orders", "CREATE TABLE orders") == 1);
    REQUIRE(materializer.tables_created() == 1);
}

TEST_CASE("DeclaredSchemaMaterializer: nothing declared is a no-op", "[schema]") {
    Fixture f;
    DeclaredSchemaMaterializer materializer;
    auto engine = f.factory.get_or_create("orders", std::nullopt);

    const auto before = f.server.statements_executed();
    materializer.materialize(*engine, "orders");
    REQUIRE(f.server.statements_executed() == before);
}

TEST_CASE("DeclaredSchemaMaterializer: DDL failure raises SchemaError", "[schema]") {
    Fixture f;
    f.server.reject_statements_containing("CREATE TABLE broken");
    DeclaredSchemaMaterializer materializer;
    materializer.declare_table("orders", {"broken", "CREATE TABLE broken (id INT)"});

    auto engine = f.factory.get_or_create("orders", std::nullopt);
    try {
        materializer.materialize(*engine, "orders");
        FAIL("expected SchemaError");
    } catch (const SchemaError& e) {
        REQUIRE(e.state() == OrchestrationState::SCHEMA_READY);
        REQUIRE(e.database() == "orders");
        REQUIRE(std::string(e.what()).find("broken") != std::string::npos);
    }
}

TEST_CASE("DeclaredSchemaMaterializer: invalid declarations", "[schema]") {
    DeclaredSchemaMaterializer materializer;
    REQUIRE_THROWS_AS(materializer.declare_table("", {"t", "CREATE TABLE t (id INT)"}),
                      ConfigurationError);
    REQUIRE_THROWS_AS(materializer.declare_table("orders", {"t", ""}), ConfigurationError);
    REQUIRE(materializer.tables("orders").empty());
}
