#pragma once

#include <memory>

#include "wslgate/gateway/command_gateway.hpp"
#include "wslgate/tools/tool.hpp"
#include "wslgate/tools/tool_registry.hpp"

namespace wslgate::tools {

/// execute_command: validate, classify, then run or park for confirmation.
class ExecuteCommandTool : public Tool {
public:
    explicit ExecuteCommandTool(gateway::CommandGateway& gateway) : gateway_(gateway) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<ToolOutput>> override;

private:
    gateway::CommandGateway& gateway_;
};

/// confirm_command: approve or reject a parked command by token.
class ConfirmCommandTool : public Tool {
public:
    explicit ConfirmCommandTool(gateway::CommandGateway& gateway) : gateway_(gateway) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<ToolOutput>> override;

private:
    gateway::CommandGateway& gateway_;
};

/// Read-only tools. Each builds a fixed command template; caller input is
/// only ever a sanitized, quoted fragment inside it.
class SystemInfoTool : public Tool {
public:
    explicit SystemInfoTool(gateway::CommandGateway& gateway) : gateway_(gateway) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<ToolOutput>> override;

private:
    gateway::CommandGateway& gateway_;
};

class EnvironmentTool : public Tool {
public:
    explicit EnvironmentTool(gateway::CommandGateway& gateway) : gateway_(gateway) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<ToolOutput>> override;

private:
    gateway::CommandGateway& gateway_;
};

class ProcessListTool : public Tool {
public:
    explicit ProcessListTool(gateway::CommandGateway& gateway) : gateway_(gateway) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<ToolOutput>> override;

private:
    gateway::CommandGateway& gateway_;
};

class DiskUsageTool : public Tool {
public:
    explicit DiskUsageTool(gateway::CommandGateway& gateway) : gateway_(gateway) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<ToolOutput>> override;

private:
    gateway::CommandGateway& gateway_;
};

class DirectoryInfoTool : public Tool {
public:
    explicit DirectoryInfoTool(gateway::CommandGateway& gateway) : gateway_(gateway) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<ToolOutput>> override;

private:
    gateway::CommandGateway& gateway_;
};

// Template builders, exposed for tests.
auto environment_command(const std::optional<std::string>& filter) -> std::string;
auto process_list_command(const std::optional<std::string>& filter) -> std::string;
auto disk_usage_command(const std::optional<std::string>& path) -> std::string;
auto directory_info_command(const std::optional<std::string>& path, bool details) -> std::string;

inline constexpr std::string_view kSystemInfoCommand =
    "uname -a && lsb_release -a 2>/dev/null || cat /etc/os-release";

/// Registers all seven tools against `gateway`.
void register_wsl_tools(ToolRegistry& registry, gateway::CommandGateway& gateway);

} // namespace wslgate::tools
