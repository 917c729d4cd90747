#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_backend.hpp"

#include <thread>

using namespace sqlsession;
using namespace sqlsession::testing;

namespace {

PoolConfig pooled_config() {
    PoolConfig config;
    config.connection_string = "dbname=orders";
    config.reuse_connections = true;
    config.min_connections = 1;
    config.max_connections = 2;
    return config;
}

} // namespace

TEST_CASE("Pool: seed connection is reused instead of opening a new one", "[pool]") {
    MockServer server;
    auto factory = std::make_shared<MockConnectionFactory>(server);
    auto seed = server.connect("orders");
    REQUIRE(seed.ok());

    GenericConnectionPool pool("orders", pooled_config(), factory, std::move(seed.connection));

    REQUIRE(server.connect_attempts() == 1);
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }
    REQUIRE(server.connect_attempts() == 1);
    REQUIRE(pool.get_stats().idle_connections == 1);
}

TEST_CASE("Pool: LIFO hands out the most recently returned connection", "[pool]") {
    MockServer server;
    auto factory = std::make_shared<MockConnectionFactory>(server);
    GenericConnectionPool pool("orders", pooled_config(), factory);

    auto a = pool.acquire();
    auto b = pool.acquire();
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);
    IDbConnection* last_returned = b->get();

    a.reset();
    b.reset();

    auto c = pool.acquire();
    REQUIRE(c->get() == last_returned);
}

TEST_CASE("Pool: max_connections bounds concurrent checkouts", "[pool]") {
    MockServer server;
    auto factory = std::make_shared<MockConnectionFactory>(server);
    GenericConnectionPool pool("orders", pooled_config(), factory);

    auto a = pool.acquire();
    auto b = pool.acquire();
    auto c = pool.acquire(std::chrono::milliseconds(20));

    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);
    REQUIRE(c == nullptr);
    REQUIRE(pool.get_stats().failed_acquires == 1);
}

TEST_CASE("Pool: without reuse every release closes the connection", "[pool]") {
    MockServer server;
    auto factory = std::make_shared<MockConnectionFactory>(server);
    auto config = pooled_config();
    config.reuse_connections = false;
    GenericConnectionPool pool("orders", config, factory);

    REQUIRE(server.connect_attempts() == 0);
    {
        auto conn = pool.acquire();
        REQUIRE(server.open_connections() == 1);
    }
    REQUIRE(server.open_connections() == 0);
    {
        auto conn = pool.acquire();
    }
    REQUIRE(server.connect_attempts() == 2);
    REQUIRE(pool.get_stats().idle_connections == 0);
}

TEST_CASE("Pool: broken connections are discarded on return", "[pool]") {
    MockServer server;
    auto factory = std::make_shared<MockConnectionFactory>(server);
    GenericConnectionPool pool("orders", pooled_config(), factory);

    {
        auto conn = pool.acquire();
        conn->invalidate();
    }
    const auto stats = pool.get_stats();
    REQUIRE(stats.connections_discarded == 1);
    REQUIRE(stats.idle_connections == 0);
}

TEST_CASE("Pool: connections past max_lifetime are recycled", "[pool]") {
    MockServer server;
    auto factory = std::make_shared<MockConnectionFactory>(server);
    auto config = pooled_config();
    config.max_lifetime = std::chrono::seconds(1);
    GenericConnectionPool pool("orders", config, factory);

    IDbConnection* first = nullptr;
    {
        auto conn = pool.acquire();
        first = conn->get();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        REQUIRE(conn->is_valid());
        (void)first;
    }
    REQUIRE(pool.get_stats().connections_recycled == 1);
}

TEST_CASE("Pool: drain closes idle connections and refuses acquires", "[pool]") {
    MockServer server;
    auto factory = std::make_shared<MockConnectionFactory>(server);
    GenericConnectionPool pool("orders", pooled_config(), factory);

    REQUIRE(server.open_connections() == 1);
    pool.drain();
    REQUIRE(server.open_connections() == 0);
    REQUIRE(pool.acquire(std::chrono::milliseconds(10)) == nullptr);

    // Idempotent
    pool.drain();
}
