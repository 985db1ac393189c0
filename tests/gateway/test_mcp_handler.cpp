#include <catch2/catch_test_macros.hpp>

#include "fake_runner.hpp"
#include "run_sync.hpp"
#include "wslgate/gateway/command_gateway.hpp"
#include "wslgate/gateway/confirmation_store.hpp"
#include "wslgate/gateway/mcp_handler.hpp"
#include "wslgate/tools/wsl_tools.hpp"

using namespace wslgate;
using namespace wslgate::gateway;
using wslgate::testing::RecordingRunner;

namespace {

struct McpFixture {
    RecordingRunner runner;
    InMemoryConfirmationStore store;
    CommandGateway command_gateway{runner, store};
    tools::ToolRegistry registry;
    Protocol protocol;

    McpFixture() {
        tools::register_wsl_tools(registry, command_gateway);
        register_mcp_handlers(protocol, registry, ServerConfig{.name = "wslgate", .version = "9.9.9"});
    }

    auto call(std::string method, json params = json::object()) -> Result<json> {
        return run_sync(protocol.dispatch(RequestFrame{
            .id = json(1), .method = std::move(method), .params = std::move(params)}));
    }
};

} // namespace

TEST_CASE("initialize reports server info and capabilities", "[mcp]") {
    McpFixture fx;

    SECTION("default protocol version") {
        auto r = fx.call("initialize");
        REQUIRE(r.has_value());
        CHECK((*r)["protocolVersion"] == std::string(kMcpProtocolVersion));
        CHECK((*r)["capabilities"]["tools"]["listChanged"] == true);
        CHECK((*r)["serverInfo"]["name"] == "wslgate");
        CHECK((*r)["serverInfo"]["version"] == "9.9.9");
    }

    SECTION("client protocol version is echoed") {
        auto r = fx.call("initialize", json{
            {"protocolVersion", "2025-03-26"},
            {"clientInfo", {{"name", "test-client"}}},
        });
        REQUIRE(r.has_value());
        CHECK((*r)["protocolVersion"] == "2025-03-26");
    }
}

TEST_CASE("ping returns an empty object", "[mcp]") {
    McpFixture fx;
    auto r = fx.call("ping");
    REQUIRE(r.has_value());
    CHECK(r->is_object());
    CHECK(r->empty());
}

TEST_CASE("tools/list advertises all seven tools", "[mcp]") {
    McpFixture fx;
    auto r = fx.call("tools/list");
    REQUIRE(r.has_value());

    const auto& list = (*r)["tools"];
    REQUIRE(list.size() == 7);

    bool saw_execute = false;
    for (const auto& tool : list) {
        CHECK(tool.contains("inputSchema"));
        if (tool["name"] == "execute_command") {
            saw_execute = true;
            CHECK(tool["annotations"]["destructiveHint"] == true);
            CHECK(tool["inputSchema"]["required"] == json::array({"command"}));
        }
        if (tool["name"] == "get_system_info") {
            CHECK(tool["annotations"]["readOnlyHint"] == true);
        }
    }
    CHECK(saw_execute);
}

TEST_CASE("tools/call wraps tool text in content blocks", "[mcp]") {
    McpFixture fx;

    SECTION("successful call") {
        auto r = fx.call("tools/call", json{
            {"name", "execute_command"},
            {"arguments", {{"command", "echo hi"}}},
        });
        REQUIRE(r.has_value());
        CHECK((*r)["content"][0]["type"] == "text");
        CHECK((*r)["content"][0]["text"] ==
              "Command: echo hi\nExit Code: 0\nOutput:\nok\nNo errors");
        CHECK_FALSE(r->contains("isError"));
    }

    SECTION("gateway error is an isError result") {
        auto r = fx.call("tools/call", json{
            {"name", "confirm_command"},
            {"arguments", {{"confirmation_id", "missing"}, {"confirm", true}}},
        });
        REQUIRE(r.has_value());
        CHECK((*r)["isError"] == true);
        CHECK((*r)["content"][0]["text"] ==
              "Error confirming command: Invalid or expired confirmation ID");
    }
}

TEST_CASE("tools/call argument problems are protocol errors", "[mcp]") {
    McpFixture fx;

    SECTION("unknown tool") {
        auto r = fx.call("tools/call", json{{"name", "format_disk"}});
        REQUIRE_FALSE(r.has_value());
        CHECK(error_code_to_jsonrpc(r.error().code()) == -32602);
    }

    SECTION("missing name") {
        auto r = fx.call("tools/call", json{{"arguments", json::object()}});
        REQUIRE_FALSE(r.has_value());
        CHECK(error_code_to_jsonrpc(r.error().code()) == -32602);
    }

    SECTION("missing required tool argument") {
        auto r = fx.call("tools/call", json{{"name", "execute_command"}});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    CHECK(fx.runner.calls.empty());
}

TEST_CASE("Full execute then confirm round trip over the protocol", "[mcp]") {
    McpFixture fx;

    auto parked = fx.call("tools/call", json{
        {"name", "execute_command"},
        {"arguments", {{"command", "rm -rf old_logs"}}},
    });
    REQUIRE(parked.has_value());
    auto prompt = (*parked)["content"][0]["text"].get<std::string>();
    auto token = prompt.substr(prompt.rfind(' ') + 1);
    CHECK(fx.runner.calls.empty());

    auto done = fx.call("tools/call", json{
        {"name", "confirm_command"},
        {"arguments", {{"confirmation_id", token}, {"confirm", true}}},
    });
    REQUIRE(done.has_value());
    REQUIRE(fx.runner.calls.size() == 1);
    CHECK(fx.runner.calls[0].command_line == "rm -rf old_logs");
}
