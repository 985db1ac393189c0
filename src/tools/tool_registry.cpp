#include "wslgate/tools/tool_registry.hpp"

#include "wslgate/core/logger.hpp"

namespace wslgate::tools {

void ToolRegistry::register_tool(std::unique_ptr<Tool> tool) {
    if (!tool) {
        LOG_WARN("Attempted to register a null tool");
        return;
    }

    auto def = tool->definition();
    auto name = def.name;

    if (tools_.contains(name)) {
        LOG_WARN("Replacing existing tool: {}", name);
    } else {
        LOG_INFO("Registered tool: {}", name);
    }

    tools_[std::move(name)] = std::move(tool);
}

auto ToolRegistry::get(std::string_view name) -> Tool* {
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        return it->second.get();
    }
    return nullptr;
}

auto ToolRegistry::get(std::string_view name) const -> const Tool* {
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        return it->second.get();
    }
    return nullptr;
}

auto ToolRegistry::list() const -> std::vector<ToolDefinition> {
    std::vector<ToolDefinition> defs;
    defs.reserve(tools_.size());

    for (const auto& [name, tool] : tools_) {
        defs.push_back(tool->definition());
    }

    return defs;
}

auto ToolRegistry::to_json() const -> json {
    json result = json::array();
    for (const auto& [name, tool] : tools_) {
        result.push_back(tool->definition().to_json());
    }
    return result;
}

auto ToolRegistry::execute(std::string_view name, json params)
    -> boost::asio::awaitable<Result<ToolOutput>> {

    auto* tool = get(name);
    if (!tool) {
        co_return make_fail(make_error(
            ErrorCode::NotFound,
            "Tool not found",
            std::string(name)));
    }

    LOG_DEBUG("Executing tool: {} with params: {}", name, params.dump());

    auto result = co_await tool->execute(std::move(params));

    if (!result.has_value()) {
        LOG_WARN("Tool {} rejected its arguments: {}", name, result.error().what());
    } else if (result->is_error) {
        LOG_DEBUG("Tool {} returned an error result", name);
    } else {
        LOG_DEBUG("Tool {} executed successfully", name);
    }

    co_return result;
}

auto ToolRegistry::size() const noexcept -> std::size_t {
    return tools_.size();
}

auto ToolRegistry::contains(std::string_view name) const -> bool {
    return tools_.find(name) != tools_.end();
}

} // namespace wslgate::tools
