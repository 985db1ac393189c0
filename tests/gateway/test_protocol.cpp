#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "run_sync.hpp"
#include "wslgate/gateway/protocol.hpp"

using wslgate::gateway::json;
using wslgate::gateway::Protocol;
using wslgate::gateway::RequestFrame;

TEST_CASE("Protocol registers and looks up methods", "[protocol]") {
    Protocol proto;

    proto.register_method("test/echo",
        [](json params) -> boost::asio::awaitable<wslgate::Result<json>> {
            co_return params;
        },
        "Echo back params");

    CHECK(proto.has_method("test/echo"));
    CHECK_FALSE(proto.has_method("nonexistent/method"));

    auto all = proto.methods();
    REQUIRE(all.size() == 1);
    CHECK(all[0].name == "test/echo");
    CHECK(all[0].description == "Echo back params");
}

TEST_CASE("Protocol dispatches to the handler", "[protocol]") {
    Protocol proto;
    proto.register_method("test/echo",
        [](json params) -> boost::asio::awaitable<wslgate::Result<json>> {
            co_return params;
        });

    auto result = run_sync(proto.dispatch(RequestFrame{
        .id = json(1), .method = "test/echo", .params = json{{"x", 42}}}));
    REQUIRE(result.has_value());
    CHECK((*result)["x"] == 42);
}

TEST_CASE("Protocol reports unknown methods as NotFound", "[protocol]") {
    Protocol proto;

    auto result = run_sync(proto.dispatch(RequestFrame{.id = json(1), .method = "missing"}));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == wslgate::ErrorCode::NotFound);
    CHECK(result.error().detail() == "missing");
}

TEST_CASE("Protocol passes handler errors through", "[protocol]") {
    Protocol proto;
    proto.register_method("test/fail",
        [](json) -> boost::asio::awaitable<wslgate::Result<json>> {
            co_return wslgate::make_fail(
                wslgate::make_error(wslgate::ErrorCode::InvalidArgument, "bad"));
        });

    auto result = run_sync(proto.dispatch(RequestFrame{.id = json(1), .method = "test/fail"}));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == wslgate::ErrorCode::InvalidArgument);
}

TEST_CASE("Protocol converts thrown exceptions to InternalError", "[protocol]") {
    Protocol proto;
    proto.register_method("test/throw",
        [](json) -> boost::asio::awaitable<wslgate::Result<json>> {
            throw std::runtime_error("kaboom");
            co_return json{};
        });

    auto result = run_sync(proto.dispatch(RequestFrame{.id = json(1), .method = "test/throw"}));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == wslgate::ErrorCode::InternalError);
    CHECK(result.error().detail() == "kaboom");
}
