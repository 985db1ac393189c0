#include "wslgate/core/types.hpp"

namespace wslgate {

auto SanitizedCommand::make(std::string text) -> Result<SanitizedCommand> {
    if (text.empty()) {
        return std::unexpected(make_error(ErrorCode::ValidationFailed,
            "Invalid command: Empty after sanitization"));
    }
    return SanitizedCommand(std::move(text));
}

void to_json(json& j, const ExecutionResult& r) {
    j = json{
        {"stdout", r.stdout_text},
        {"stderr", r.stderr_text},
        {"exit_code", r.exit_code ? json(*r.exit_code) : json(nullptr)},
        {"command", r.command},
    };
    if (r.working_dir) j["working_dir"] = *r.working_dir;
    if (r.requires_confirmation) j["requires_confirmation"] = *r.requires_confirmation;
    if (r.error) j["error"] = *r.error;
    if (r.confirmation_id) j["confirmation_id"] = *r.confirmation_id;
}

void to_json(json& j, const PendingConfirmation& p) {
    j = json{
        {"token", p.token},
        {"command", p.request.command.str()},
        {"created_at_ms", p.created_at_ms},
    };
    j["working_dir"] = p.request.working_dir ? json(*p.request.working_dir) : json(nullptr);
    j["timeout_ms"] = p.request.timeout_ms ? json(*p.request.timeout_ms) : json(nullptr);
}

auto parse_pending_confirmation(const json& j) -> Result<PendingConfirmation> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Pending confirmation must be a JSON object"));
    }

    try {
        auto command = SanitizedCommand::make(j.at("command").get<std::string>());
        if (!command) {
            return std::unexpected(command.error());
        }

        std::optional<std::string> working_dir;
        if (j.contains("working_dir") && !j["working_dir"].is_null()) {
            working_dir = j["working_dir"].get<std::string>();
        }
        std::optional<int64_t> timeout_ms;
        if (j.contains("timeout_ms") && !j["timeout_ms"].is_null()) {
            timeout_ms = j["timeout_ms"].get<int64_t>();
        }

        return PendingConfirmation{
            .token = j.at("token").get<std::string>(),
            .request = ValidatedCommand{
                .command = std::move(*command),
                .working_dir = std::move(working_dir),
                .timeout_ms = timeout_ms,
            },
            .created_at_ms = j.value("created_at_ms", int64_t{0}),
        };
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Failed to deserialize pending confirmation", e.what()));
    }
}

} // namespace wslgate
