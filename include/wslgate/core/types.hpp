#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "wslgate/core/error.hpp"

namespace wslgate {

using json = nlohmann::json;

/// A command string that went through sanitization. Never empty: the only
/// way to obtain one is `make`, which rejects empty text.
class SanitizedCommand {
public:
    static auto make(std::string text) -> Result<SanitizedCommand>;

    [[nodiscard]] auto str() const noexcept -> const std::string& { return text_; }

    friend auto operator==(const SanitizedCommand&, const SanitizedCommand&) -> bool = default;

private:
    explicit SanitizedCommand(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

/// Inbound "run command" request as received from the caller.
struct CommandRequest {
    std::string raw_command;
    std::optional<std::string> working_dir;
    std::optional<double> timeout_ms;
};

/// A request whose command, working directory and timeout all passed
/// validation.
struct ValidatedCommand {
    SanitizedCommand command;
    std::optional<std::string> working_dir;
    std::optional<int64_t> timeout_ms;
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;  // absent when the process reported none
    std::string command;
    std::optional<std::string> working_dir;
    std::optional<bool> requires_confirmation;
    std::optional<std::string> error;
    std::optional<std::string> confirmation_id;
};

void to_json(json& j, const ExecutionResult& r);

/// A dangerous command parked until a second, explicit approval arrives.
/// Plain data so any ConfirmationStore backend can hold it.
struct PendingConfirmation {
    std::string token;
    ValidatedCommand request;
    int64_t created_at_ms = 0;
};

void to_json(json& j, const PendingConfirmation& p);
auto parse_pending_confirmation(const json& j) -> Result<PendingConfirmation>;

} // namespace wslgate
