#pragma once

#include "wslgate/core/config.hpp"
#include "wslgate/gateway/protocol.hpp"
#include "wslgate/tools/tool_registry.hpp"

namespace wslgate::gateway {

/// Protocol revision reported when the client does not name one.
inline constexpr std::string_view kMcpProtocolVersion = "2024-11-05";

/// Registers initialize, notifications/initialized, ping, tools/list and
/// tools/call against `tools`.
void register_mcp_handlers(Protocol& protocol,
                           tools::ToolRegistry& tools,
                           const ServerConfig& server);

/// Wraps a tool's text in an MCP content block.
auto make_tool_result(const tools::ToolOutput& output) -> json;

} // namespace wslgate::gateway
