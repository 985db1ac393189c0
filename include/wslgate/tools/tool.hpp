#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "wslgate/core/error.hpp"

namespace wslgate::tools {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Describes a single parameter for a tool.
struct ToolParameter {
    std::string name;
    std::string type;         // JSON Schema type: "string", "number", "boolean"
    std::string description;
    bool required = true;
    std::optional<json> default_value;
};

/// Behaviour hints advertised to clients.
struct ToolAnnotations {
    bool read_only = false;
    bool destructive = false;
};

/// Full definition of a tool as advertised by tools/list.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    ToolAnnotations annotations;

    /// {name, description, inputSchema, annotations}
    [[nodiscard]] auto to_json() const -> json;
};

/// What a tool call produces. `is_error` marks a failure the caller should
/// see as an error result rather than a protocol error.
struct ToolOutput {
    std::string text;
    bool is_error = false;
};

/// Abstract base class for tools exposed over the protocol.
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual auto definition() const -> ToolDefinition = 0;

    /// Execute the tool. Argument shape errors come back as
    /// ErrorCode::InvalidArgument; everything else is a ToolOutput.
    virtual auto execute(json params) -> awaitable<Result<ToolOutput>> = 0;
};

// Argument helpers shared by tool implementations.
auto require_string(const json& params, std::string_view key) -> Result<std::string>;
auto optional_string(const json& params, std::string_view key)
    -> Result<std::optional<std::string>>;
auto require_bool(const json& params, std::string_view key) -> Result<bool>;
auto optional_bool(const json& params, std::string_view key) -> Result<std::optional<bool>>;

} // namespace wslgate::tools
