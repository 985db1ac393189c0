#include "wslgate/gateway/protocol.hpp"

#include "wslgate/core/logger.hpp"

namespace wslgate::gateway {

void Protocol::register_method(std::string name, MethodHandler handler,
                               std::string description) {
    LOG_DEBUG("Registering method: {}", name);
    auto key = name;
    methods_[std::move(key)] = Entry{
        .handler = std::move(handler),
        .info = MethodInfo{
            .name = std::move(name),
            .description = std::move(description),
        },
    };
}

auto Protocol::has_method(std::string_view name) const -> bool {
    return methods_.contains(std::string(name));
}

auto Protocol::methods() const -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    result.reserve(methods_.size());
    for (const auto& [_, entry] : methods_) {
        result.push_back(entry.info);
    }
    return result;
}

auto Protocol::dispatch(const RequestFrame& request) -> awaitable<Result<json>> {
    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        co_return make_fail(
            make_error(ErrorCode::NotFound, "Method not found", request.method));
    }

    try {
        co_return co_await it->second.handler(request.params);
    } catch (const std::exception& e) {
        LOG_ERROR("Method {} threw exception: {}", request.method, e.what());
        co_return make_fail(
            make_error(ErrorCode::InternalError, "Internal error", e.what()));
    }
}

} // namespace wslgate::gateway
