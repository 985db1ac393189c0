#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "wslgate/core/error.hpp"
#include "wslgate/tools/tool.hpp"

namespace wslgate::tools {

/// Registry that holds all tools exposed over the protocol.
///
/// Tools are registered by name and can be looked up, listed, or executed
/// by name. The registry owns all registered tool instances.
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;

    /// Register a tool. The registry takes ownership. If a tool with the
    /// same name already exists, it will be replaced.
    void register_tool(std::unique_ptr<Tool> tool);

    /// Look up a tool by name. Returns nullptr if not found.
    [[nodiscard]] auto get(std::string_view name) -> Tool*;
    [[nodiscard]] auto get(std::string_view name) const -> const Tool*;

    /// Definitions for all registered tools, ordered by name.
    [[nodiscard]] auto list() const -> std::vector<ToolDefinition>;

    /// Definitions in tools/list wire format.
    [[nodiscard]] auto to_json() const -> json;

    /// Execute a tool by name. Returns NotFound if no such tool exists.
    auto execute(std::string_view name, json params)
        -> boost::asio::awaitable<Result<ToolOutput>>;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

private:
    std::map<std::string, std::unique_ptr<Tool>, std::less<>> tools_;
};

} // namespace wslgate::tools
