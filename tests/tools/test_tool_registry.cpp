#include <catch2/catch_test_macros.hpp>

#include <memory>

#include "run_sync.hpp"
#include "wslgate/tools/tool_registry.hpp"

using namespace wslgate::tools;

/// Minimal stub tool for testing the registry.
class StubTool : public Tool {
public:
    StubTool(std::string name, std::string desc)
        : name_(std::move(name)), desc_(std::move(desc)) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override {
        return ToolDefinition{
            .name = name_,
            .description = desc_,
            .parameters = {
                ToolParameter{
                    .name = "input",
                    .type = "string",
                    .description = "Input value",
                    .required = true,
                },
                ToolParameter{
                    .name = "verbose",
                    .type = "boolean",
                    .description = "More output",
                    .required = false,
                    .default_value = false,
                },
            },
            .annotations = {.read_only = true, .destructive = false},
        };
    }

    auto execute(json params) -> awaitable<wslgate::Result<ToolOutput>> override {
        auto input = require_string(params, "input");
        if (!input) co_return wslgate::make_fail(input.error());
        co_return ToolOutput{.text = name_ + ":" + *input};
    }

private:
    std::string name_;
    std::string desc_;
};

TEST_CASE("ToolRegistry starts empty", "[tools][tool_registry]") {
    ToolRegistry reg;

    CHECK(reg.size() == 0);
    CHECK(reg.list().empty());
    CHECK(reg.to_json().empty());
    CHECK_FALSE(reg.contains("anything"));
}

TEST_CASE("ToolRegistry register and lookup", "[tools][tool_registry]") {
    ToolRegistry reg;

    reg.register_tool(std::make_unique<StubTool>("list_processes", "List processes"));
    reg.register_tool(std::make_unique<StubTool>("get_disk_usage", "Disk space"));

    SECTION("size reflects registrations") {
        CHECK(reg.size() == 2);
    }

    SECTION("contains and get") {
        CHECK(reg.contains("list_processes"));
        CHECK_FALSE(reg.contains("nonexistent"));
        auto* tool = reg.get("get_disk_usage");
        REQUIRE(tool != nullptr);
        CHECK(tool->definition().description == "Disk space");
        CHECK(reg.get("missing") == nullptr);
    }

    SECTION("list is ordered by name") {
        auto defs = reg.list();
        REQUIRE(defs.size() == 2);
        CHECK(defs[0].name == "get_disk_usage");
        CHECK(defs[1].name == "list_processes");
    }

    SECTION("re-registering replaces") {
        reg.register_tool(std::make_unique<StubTool>("list_processes", "Replaced"));
        CHECK(reg.size() == 2);
        CHECK(reg.get("list_processes")->definition().description == "Replaced");
    }

    SECTION("null tools are ignored") {
        reg.register_tool(nullptr);
        CHECK(reg.size() == 2);
    }
}

TEST_CASE("ToolDefinition renders an input schema", "[tools][tool_registry]") {
    auto j = StubTool("t", "desc").definition().to_json();

    CHECK(j["name"] == "t");
    CHECK(j["inputSchema"]["type"] == "object");
    CHECK(j["inputSchema"]["properties"]["input"]["type"] == "string");
    CHECK(j["inputSchema"]["properties"]["verbose"]["default"] == false);
    CHECK(j["inputSchema"]["required"] == json::array({"input"}));
    CHECK(j["annotations"]["readOnlyHint"] == true);
    CHECK(j["annotations"]["destructiveHint"] == false);
}

TEST_CASE("ToolRegistry execute", "[tools][tool_registry]") {
    ToolRegistry reg;
    reg.register_tool(std::make_unique<StubTool>("echo", "Echo"));

    SECTION("known tool") {
        auto r = run_sync(reg.execute("echo", json{{"input", "hi"}}));
        REQUIRE(r.has_value());
        CHECK(r->text == "echo:hi");
        CHECK_FALSE(r->is_error);
    }

    SECTION("unknown tool") {
        auto r = run_sync(reg.execute("nope", json::object()));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == wslgate::ErrorCode::NotFound);
        CHECK(r.error().detail() == "nope");
    }

    SECTION("bad arguments") {
        auto r = run_sync(reg.execute("echo", json{{"input", 5}}));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == wslgate::ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Argument helpers", "[tools]") {
    json params{{"s", "text"}, {"b", true}, {"n", nullptr}, {"i", 3}};

    CHECK(require_string(params, "s").value() == "text");
    CHECK_FALSE(require_string(params, "missing").has_value());
    CHECK_FALSE(require_string(params, "n").has_value());
    CHECK_FALSE(require_string(params, "i").has_value());

    CHECK_FALSE(optional_string(params, "n").value().has_value());
    CHECK_FALSE(optional_string(params, "i").has_value());

    CHECK(require_bool(params, "b").value());
    CHECK_FALSE(require_bool(params, "s").has_value());
    CHECK(optional_bool(params, "missing").value() == std::nullopt);
}
