#include "wslgate/tools/tool.hpp"

namespace wslgate::tools {

auto ToolDefinition::to_json() const -> json {
    json j;
    j["name"] = name;
    j["description"] = description;

    json schema;
    schema["type"] = "object";

    json properties = json::object();
    json required_params = json::array();

    for (const auto& param : parameters) {
        json prop;
        prop["type"] = param.type;
        prop["description"] = param.description;

        if (param.default_value.has_value()) {
            prop["default"] = *param.default_value;
        }

        properties[param.name] = prop;

        if (param.required) {
            required_params.push_back(param.name);
        }
    }

    schema["properties"] = properties;
    if (!required_params.empty()) {
        schema["required"] = required_params;
    }

    j["inputSchema"] = schema;
    j["annotations"] = json{
        {"readOnlyHint", annotations.read_only},
        {"destructiveHint", annotations.destructive},
    };
    return j;
}

namespace {

auto find_key(const json& params, std::string_view key) -> const json* {
    if (!params.is_object()) return nullptr;
    auto it = params.find(std::string(key));
    if (it == params.end() || it->is_null()) return nullptr;
    return &*it;
}

auto type_error(std::string_view key, std::string_view expected) -> Error {
    return make_error(ErrorCode::InvalidArgument,
        "Invalid argument '" + std::string(key) + "'",
        "expected " + std::string(expected));
}

} // anonymous namespace

auto require_string(const json& params, std::string_view key) -> Result<std::string> {
    const auto* value = find_key(params, key);
    if (!value) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Missing required argument '" + std::string(key) + "'"));
    }
    if (!value->is_string()) {
        return std::unexpected(type_error(key, "string"));
    }
    return value->get<std::string>();
}

auto optional_string(const json& params, std::string_view key)
    -> Result<std::optional<std::string>> {
    const auto* value = find_key(params, key);
    if (!value) return std::optional<std::string>{};
    if (!value->is_string()) {
        return std::unexpected(type_error(key, "string"));
    }
    return std::optional<std::string>(value->get<std::string>());
}

auto require_bool(const json& params, std::string_view key) -> Result<bool> {
    const auto* value = find_key(params, key);
    if (!value) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Missing required argument '" + std::string(key) + "'"));
    }
    if (!value->is_boolean()) {
        return std::unexpected(type_error(key, "boolean"));
    }
    return value->get<bool>();
}

auto optional_bool(const json& params, std::string_view key) -> Result<std::optional<bool>> {
    const auto* value = find_key(params, key);
    if (!value) return std::optional<bool>{};
    if (!value->is_boolean()) {
        return std::unexpected(type_error(key, "boolean"));
    }
    return std::optional<bool>(value->get<bool>());
}

} // namespace wslgate::tools
