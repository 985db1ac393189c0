#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "wslgate/core/error.hpp"

namespace wslgate::gateway {

using json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion = "2.0";

/// A JSON-RPC 2.0 request. `id` is absent for notifications.
struct RequestFrame {
    std::optional<json> id;
    std::string method;
    json params = json::object();

    [[nodiscard]] auto is_notification() const noexcept -> bool {
        return !id.has_value();
    }
};

void to_json(json& j, const RequestFrame& f);

/// A JSON-RPC 2.0 response. Exactly one of result / error is set.
struct ResponseFrame {
    json id;
    std::optional<json> result;
    std::optional<json> error;

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return error.has_value();
    }
};

void to_json(json& j, const ResponseFrame& f);
void from_json(const json& j, ResponseFrame& f);

/// Parse one line from the wire into a request.
/// Malformed JSON fails with SerializationError; a well-formed message that
/// is not a request fails with ProtocolError.
auto parse_frame(std::string_view data) -> Result<RequestFrame>;

/// Serialize a response to a single line (no trailing newline).
auto serialize_frame(const ResponseFrame& frame) -> std::string;

/// Build a success response for a given request id.
auto make_response(json id, json result) -> ResponseFrame;

/// Build an error response carrying the JSON-RPC code for `error`.
auto make_error_response(json id, const Error& error) -> ResponseFrame;

/// Same, with an explicit JSON-RPC code.
auto make_error_response(json id, int code, std::string_view message) -> ResponseFrame;

} // namespace wslgate::gateway
