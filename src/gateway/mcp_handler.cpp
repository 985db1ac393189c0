#include "wslgate/gateway/mcp_handler.hpp"

#include "wslgate/core/logger.hpp"

#ifndef WSLGATE_VERSION_STRING
#define WSLGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace wslgate::gateway {

auto make_tool_result(const tools::ToolOutput& output) -> json {
    json result{
        {"content", json::array({
            json{{"type", "text"}, {"text", output.text}},
        })},
    };
    if (output.is_error) result["isError"] = true;
    return result;
}

void register_mcp_handlers(Protocol& protocol,
                           tools::ToolRegistry& tools,
                           const ServerConfig& server) {
    auto name = server.name;
    auto version = server.version.empty() ? std::string(WSLGATE_VERSION_STRING)
                                          : server.version;

    // initialize
    protocol.register_method("initialize",
        [name, version](json params) -> awaitable<Result<json>> {
            std::string protocol_version(kMcpProtocolVersion);
            if (params.is_object() && params.contains("protocolVersion") &&
                params["protocolVersion"].is_string()) {
                protocol_version = params["protocolVersion"].get<std::string>();
            }
            if (params.is_object() && params.contains("clientInfo") &&
                params["clientInfo"].is_object()) {
                LOG_INFO("Client connected: {}",
                         params["clientInfo"].value("name", "unknown"));
            }
            co_return json{
                {"protocolVersion", protocol_version},
                {"capabilities", {{"tools", {{"listChanged", true}}}}},
                {"serverInfo", {
                    {"name", name},
                    {"version", version},
                    {"description", "Gated command execution for WSL"},
                }},
            };
        },
        "Handshake");

    protocol.register_method("notifications/initialized",
        []([[maybe_unused]] json params) -> awaitable<Result<json>> {
            LOG_DEBUG("Client initialization complete");
            co_return json::object();
        },
        "Client ready notification");

    protocol.register_method("ping",
        []([[maybe_unused]] json params) -> awaitable<Result<json>> {
            co_return json::object();
        },
        "Liveness check");

    // tools/list
    protocol.register_method("tools/list",
        [&tools]([[maybe_unused]] json params) -> awaitable<Result<json>> {
            co_return json{{"tools", tools.to_json()}};
        },
        "List available tools");

    // tools/call
    protocol.register_method("tools/call",
        [&tools](json params) -> awaitable<Result<json>> {
            if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                    "Missing required argument 'name'"));
            }
            auto tool_name = params["name"].get<std::string>();
            if (!tools.contains(tool_name)) {
                LOG_WARN("Call to unknown tool: {}", tool_name);
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                    "Unknown tool", tool_name));
            }

            json arguments = json::object();
            if (params.contains("arguments") && !params["arguments"].is_null()) {
                arguments = params["arguments"];
            }

            auto output = co_await tools.execute(tool_name, std::move(arguments));
            if (!output) {
                LOG_WARN("Tool {} failed: {}", tool_name, output.error().what());
                co_return make_fail(output.error());
            }
            co_return make_tool_result(*output);
        },
        "Invoke a tool");
}

} // namespace wslgate::gateway
