#include <catch2/catch_test_macros.hpp>
#include "session/async_session_manager.hpp"
#include "core/error.hpp"
#include "mocks/mock_backend.hpp"

#include <chrono>
#include <stdexcept>

using namespace sqlsession;
using namespace sqlsession::testing;
using namespace std::chrono_literals;

namespace {

struct AsyncFixture {
    MockServer server;
    std::shared_ptr<HookRegistry> hooks = std::make_shared<HookRegistry>();
    AsyncSessionManager async{ConnectionDescriptor(test_settings()), hooks, nullptr,
                              std::make_shared<MockBackend>(server)};
};

} // namespace

TEST_CASE("AsyncSessionManager: requires a manager", "[async]") {
    REQUIRE_THROWS_AS(AsyncSessionManager(std::shared_ptr<SessionManager>{}), ConfigurationError);
}

TEST_CASE("AsyncSessionManager: cached engine yields a ready future", "[async]") {
    AsyncFixture f;
    auto engine = f.async.get_engine("orders", "t1").get();
    REQUIRE(engine->database() == "t1__orders");

    auto future = f.async.get_session("orders", "t1");
    REQUIRE(future.wait_for(0ms) == std::future_status::ready);

    auto session = future.get();
    REQUIRE(session.engine() == engine);
}

TEST_CASE("AsyncSessionManager: first request completes on a worker", "[async]") {
    AsyncFixture f;
    f.server.set_connect_delay(30ms);

    auto future = f.async.get_session("orders");
    auto session = future.get();
    REQUIRE(session.database() == "orders");
    REQUIRE(f.server.successful_connects() >= 1);
}

TEST_CASE("AsyncSessionManager: errors propagate through the future", "[async]") {
    AsyncFixture f;
    f.hooks->register_precreate("orders",
        [](const TenantId&) -> std::string { throw std::runtime_error("no extension"); });

    auto future = f.async.get_session("orders", "t1");
    REQUIRE_THROWS_AS(future.get(), HookExecutionError);
}

TEST_CASE("AsyncSessionManager: run_in_session commits on the worker", "[async]") {
    AsyncFixture f;
    auto future = f.async.run_in_session("orders", "t1", [](Session& s) {
        s.execute("INSERT INTO items VALUES (1)");
        return s.database();
    });

    REQUIRE(future.get() == "t1__orders");
    REQUIRE(f.server.count_committed("t1__orders", "INSERT INTO items") == 1);
}

TEST_CASE("AsyncSessionManager: pending requests keep the manager alive", "[async]") {
    MockServer server;
    std::future<Session> future;
    {
        AsyncSessionManager async{ConnectionDescriptor(test_settings()),
                                  std::make_shared<HookRegistry>(), nullptr,
                                  std::make_shared<MockBackend>(server)};
        server.set_connect_delay(30ms);
        future = async.get_session("orders");
    }

    auto session = future.get();
    REQUIRE(session.database() == "orders");
    REQUIRE(server.successful_connects() >= 1);
}
