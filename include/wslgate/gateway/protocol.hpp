#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "wslgate/core/error.hpp"
#include "wslgate/gateway/frame.hpp"

namespace wslgate::gateway {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Signature for an RPC method handler.
/// Receives params as JSON; failures carry the ErrorCode that selects the
/// JSON-RPC error code.
using MethodHandler = std::function<awaitable<Result<json>>(json params)>;

/// Metadata about a registered RPC method.
struct MethodInfo {
    std::string name;
    std::string description;
};

/// Method registry and dispatcher. Routes incoming RequestFrames to the
/// handler registered under their method name.
class Protocol {
public:
    Protocol() = default;

    void register_method(std::string name, MethodHandler handler,
                         std::string description = "");

    [[nodiscard]] auto has_method(std::string_view name) const -> bool;

    /// All registered methods, unordered.
    [[nodiscard]] auto methods() const -> std::vector<MethodInfo>;

    /// Dispatch a request to the matching handler.
    /// Returns NotFound if the method is not registered.
    auto dispatch(const RequestFrame& request) -> awaitable<Result<json>>;

private:
    struct Entry {
        MethodHandler handler;
        MethodInfo info;
    };

    std::unordered_map<std::string, Entry> methods_;
};

} // namespace wslgate::gateway
