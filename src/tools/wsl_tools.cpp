#include "wslgate/tools/wsl_tools.hpp"

#include "wslgate/infra/exec_safety.hpp"

#include <limits>

namespace wslgate::tools {

namespace {

auto to_output(gateway::Reply reply) -> ToolOutput {
    return ToolOutput{.text = std::move(reply.text), .is_error = reply.is_error};
}

/// Sanitized fragment, or nullopt when nothing usable is left.
auto clean_fragment(const std::optional<std::string>& raw) -> std::optional<std::string> {
    if (!raw) return std::nullopt;
    auto cleaned = infra::sanitize_argument(*raw);
    if (cleaned.empty()) return std::nullopt;
    return cleaned;
}

} // anonymous namespace

auto environment_command(const std::optional<std::string>& filter) -> std::string {
    auto f = clean_fragment(filter);
    return f ? "env | grep -i \"" + *f + "\"" : std::string("env");
}

auto process_list_command(const std::optional<std::string>& filter) -> std::string {
    auto f = clean_fragment(filter);
    return f ? "ps aux | grep -i \"" + *f + "\" | grep -v grep" : std::string("ps aux");
}

auto disk_usage_command(const std::optional<std::string>& path) -> std::string {
    auto p = clean_fragment(path);
    return p ? "df -h \"" + *p + "\"" : std::string("df -h");
}

auto directory_info_command(const std::optional<std::string>& path, bool details) -> std::string {
    auto dir = clean_fragment(path).value_or(".");
    return (details ? "ls -lah \"" : "ls -A \"") + dir + "\"";
}

// ---------------------------------------------------------------------------
// execute_command
// ---------------------------------------------------------------------------

auto ExecuteCommandTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "execute_command",
        .description = "Execute a command in WSL (use read-only tools when possible)",
        .parameters = {
            {.name = "command", .type = "string", .description = "Command to execute"},
            {.name = "working_dir", .type = "string", .description = "Working directory",
             .required = false},
            {.name = "timeout", .type = "number", .description = "Timeout (ms)",
             .required = false},
        },
        .annotations = {.read_only = false, .destructive = true},
    };
}

auto ExecuteCommandTool::execute(json params) -> awaitable<Result<ToolOutput>> {
    auto command = require_string(params, "command");
    if (!command) co_return make_fail(command.error());

    auto working_dir = optional_string(params, "working_dir");
    if (!working_dir) co_return make_fail(working_dir.error());

    // A non-numeric timeout is the validator's to reject, not the schema's.
    std::optional<double> timeout;
    for (const char* key : {"timeout", "timeout_ms"}) {
        if (!params.contains(key) || params[key].is_null()) continue;
        timeout = params[key].is_number()
            ? params[key].get<double>()
            : std::numeric_limits<double>::quiet_NaN();
        break;
    }

    auto reply = co_await gateway_.execute(CommandRequest{
        .raw_command = std::move(*command),
        .working_dir = std::move(*working_dir),
        .timeout_ms = timeout,
    });
    co_return to_output(std::move(reply));
}

// ---------------------------------------------------------------------------
// confirm_command
// ---------------------------------------------------------------------------

auto ConfirmCommandTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "confirm_command",
        .description = "Confirm dangerous command execution",
        .parameters = {
            {.name = "confirmation_id", .type = "string", .description = "Confirmation ID"},
            {.name = "confirm", .type = "boolean", .description = "Proceed with execution"},
        },
        .annotations = {.read_only = false, .destructive = true},
    };
}

auto ConfirmCommandTool::execute(json params) -> awaitable<Result<ToolOutput>> {
    auto token = require_string(params, "confirmation_id");
    if (!token) co_return make_fail(token.error());

    auto approve = require_bool(params, "confirm");
    if (!approve) co_return make_fail(approve.error());

    auto reply = co_await gateway_.confirm(std::move(*token), *approve);
    co_return to_output(std::move(reply));
}

// ---------------------------------------------------------------------------
// Read-only tools
// ---------------------------------------------------------------------------

auto SystemInfoTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "get_system_info",
        .description = "Get WSL system information",
        .parameters = {},
        .annotations = {.read_only = true, .destructive = false},
    };
}

auto SystemInfoTool::execute([[maybe_unused]] json params) -> awaitable<Result<ToolOutput>> {
    co_return to_output(co_await gateway_.run_readonly(std::string(kSystemInfoCommand)));
}

auto EnvironmentTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "get_environment",
        .description = "Get WSL environment variables",
        .parameters = {
            {.name = "filter", .type = "string", .description = "Filter pattern (grep)",
             .required = false},
        },
        .annotations = {.read_only = true, .destructive = false},
    };
}

auto EnvironmentTool::execute(json params) -> awaitable<Result<ToolOutput>> {
    auto filter = optional_string(params, "filter");
    if (!filter) co_return make_fail(filter.error());
    co_return to_output(co_await gateway_.run_readonly(environment_command(*filter)));
}

auto ProcessListTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "list_processes",
        .description = "List running processes in WSL",
        .parameters = {
            {.name = "filter", .type = "string", .description = "Filter by name",
             .required = false},
        },
        .annotations = {.read_only = true, .destructive = false},
    };
}

auto ProcessListTool::execute(json params) -> awaitable<Result<ToolOutput>> {
    auto filter = optional_string(params, "filter");
    if (!filter) co_return make_fail(filter.error());
    co_return to_output(co_await gateway_.run_readonly(process_list_command(*filter)));
}

auto DiskUsageTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "get_disk_usage",
        .description = "Get disk space information",
        .parameters = {
            {.name = "path", .type = "string", .description = "Path to check",
             .required = false},
        },
        .annotations = {.read_only = true, .destructive = false},
    };
}

auto DiskUsageTool::execute(json params) -> awaitable<Result<ToolOutput>> {
    auto path = optional_string(params, "path");
    if (!path) co_return make_fail(path.error());
    co_return to_output(co_await gateway_.run_readonly(disk_usage_command(*path)));
}

auto DirectoryInfoTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "get_directory_info",
        .description = "Get directory contents and info",
        .parameters = {
            {.name = "path", .type = "string", .description = "Directory path",
             .required = false},
            {.name = "details", .type = "boolean", .description = "Show detailed info",
             .required = false},
        },
        .annotations = {.read_only = true, .destructive = false},
    };
}

auto DirectoryInfoTool::execute(json params) -> awaitable<Result<ToolOutput>> {
    auto path = optional_string(params, "path");
    if (!path) co_return make_fail(path.error());
    auto details = optional_bool(params, "details");
    if (!details) co_return make_fail(details.error());

    co_return to_output(co_await gateway_.run_readonly(
        directory_info_command(*path, details->value_or(false))));
}

void register_wsl_tools(ToolRegistry& registry, gateway::CommandGateway& gateway) {
    registry.register_tool(std::make_unique<SystemInfoTool>(gateway));
    registry.register_tool(std::make_unique<EnvironmentTool>(gateway));
    registry.register_tool(std::make_unique<ProcessListTool>(gateway));
    registry.register_tool(std::make_unique<DiskUsageTool>(gateway));
    registry.register_tool(std::make_unique<DirectoryInfoTool>(gateway));
    registry.register_tool(std::make_unique<ExecuteCommandTool>(gateway));
    registry.register_tool(std::make_unique<ConfirmCommandTool>(gateway));
}

} // namespace wslgate::tools
