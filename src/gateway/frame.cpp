#include "wslgate/gateway/frame.hpp"

namespace wslgate::gateway {

// -- RequestFrame serialization --

void to_json(json& j, const RequestFrame& f) {
    j = json{
        {"jsonrpc", std::string(kJsonRpcVersion)},
        {"method", f.method},
        {"params", f.params},
    };
    if (f.id) j["id"] = *f.id;
}

// -- ResponseFrame serialization --

void to_json(json& j, const ResponseFrame& f) {
    j = json{
        {"jsonrpc", std::string(kJsonRpcVersion)},
        {"id", f.id},
    };
    if (f.error) {
        j["error"] = *f.error;
    } else {
        j["result"] = f.result.value_or(json::object());
    }
}

void from_json(const json& j, ResponseFrame& f) {
    f.id = j.value("id", json(nullptr));
    if (j.contains("result")) f.result = j.at("result");
    if (j.contains("error")) f.error = j.at("error");
}

// -- Frame parsing --

auto parse_frame(std::string_view data) -> Result<RequestFrame> {
    json j;
    try {
        j = json::parse(data);
    } catch (const json::parse_error& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Parse error", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError, "Invalid Request",
                       "message must be a JSON object"));
    }

    auto version = j.find("jsonrpc");
    if (version != j.end() && (!version->is_string() || version->get<std::string>() != kJsonRpcVersion)) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError, "Invalid Request",
                       "unsupported jsonrpc version"));
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError, "Invalid Request",
                       "missing method"));
    }

    RequestFrame f;
    f.method = method->get<std::string>();

    if (auto id = j.find("id"); id != j.end()) {
        if (!id->is_string() && !id->is_number() && !id->is_null()) {
            return std::unexpected(
                make_error(ErrorCode::ProtocolError, "Invalid Request",
                           "id must be a string, number or null"));
        }
        f.id = *id;
    }

    if (auto params = j.find("params"); params != j.end() && !params->is_null()) {
        if (!params->is_object() && !params->is_array()) {
            return std::unexpected(
                make_error(ErrorCode::ProtocolError, "Invalid Request",
                           "params must be structured"));
        }
        f.params = *params;
    }

    return f;
}

auto serialize_frame(const ResponseFrame& frame) -> std::string {
    json j = frame;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// -- Factory helpers --

auto make_response(json id, json result) -> ResponseFrame {
    return ResponseFrame{
        .id = std::move(id),
        .result = std::move(result),
        .error = std::nullopt,
    };
}

auto make_error_response(json id, const Error& error) -> ResponseFrame {
    auto resp = make_error_response(std::move(id), error_code_to_jsonrpc(error.code()),
                                    error.message());
    if (!error.detail().empty()) {
        (*resp.error)["data"] = json{
            {"code", std::string(error_code_to_string(error.code()))},
            {"detail", std::string(error.detail())},
        };
    }
    return resp;
}

auto make_error_response(json id, int code, std::string_view message) -> ResponseFrame {
    return ResponseFrame{
        .id = std::move(id),
        .result = std::nullopt,
        .error = json{
            {"code", code},
            {"message", std::string(message)},
        },
    };
}

} // namespace wslgate::gateway
