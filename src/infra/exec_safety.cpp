#include "wslgate/infra/exec_safety.hpp"

#include "wslgate/core/config.hpp"
#include "wslgate/core/logger.hpp"
#include "wslgate/core/utils.hpp"

#include <cmath>

namespace wslgate::infra {

namespace {

auto strip_metacharacters(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (kShellMetacharacters.find(c) != std::string_view::npos) continue;
        out += (c == '\\') ? '/' : c;
    }
    return out;
}

auto strip_path_escapes(std::string s) -> std::string {
    s = utils::replace_all(std::move(s), "..", "");
    return utils::replace_all(std::move(s), "~", "");
}

} // anonymous namespace

auto sanitize_command(std::string_view command) -> Result<SanitizedCommand> {
    auto sanitized = utils::trim(strip_path_escapes(strip_metacharacters(command)));
    if (sanitized.size() != command.size()) {
        LOG_TRACE("Sanitized command '{}' -> '{}'", command, sanitized);
    }
    return SanitizedCommand::make(std::move(sanitized));
}

auto validate_working_dir(const std::optional<std::string>& working_dir)
    -> Result<std::optional<std::string>> {
    if (!working_dir || working_dir->empty()) {
        return std::optional<std::string>{};
    }

    auto sanitized = utils::trim(strip_metacharacters(*working_dir));
    if (sanitized.empty()) {
        return std::unexpected(make_error(ErrorCode::ValidationFailed,
            "Invalid working directory"));
    }
    return std::optional<std::string>(std::move(sanitized));
}

auto validate_timeout(std::optional<double> timeout_ms)
    -> Result<std::optional<int64_t>> {
    if (!timeout_ms || *timeout_ms == 0.0) {
        return std::optional<int64_t>{};
    }

    if (!std::isfinite(*timeout_ms) || *timeout_ms < 0.0 ||
        *timeout_ms > static_cast<double>(kMaxTimeoutMs)) {
        return std::unexpected(make_error(ErrorCode::ValidationFailed,
            "Invalid timeout value"));
    }
    return std::optional<int64_t>(static_cast<int64_t>(std::ceil(*timeout_ms)));
}

auto validate_request(const CommandRequest& request) -> Result<ValidatedCommand> {
    auto command = sanitize_command(request.raw_command);
    if (!command) return std::unexpected(command.error());

    auto working_dir = validate_working_dir(request.working_dir);
    if (!working_dir) return std::unexpected(working_dir.error());

    auto timeout = validate_timeout(request.timeout_ms);
    if (!timeout) return std::unexpected(timeout.error());

    return ValidatedCommand{
        .command = std::move(*command),
        .working_dir = std::move(*working_dir),
        .timeout_ms = *timeout,
    };
}

auto sanitize_argument(std::string_view fragment) -> std::string {
    auto out = strip_path_escapes(strip_metacharacters(fragment));
    std::erase(out, '"');
    return utils::trim(out);
}

} // namespace wslgate::infra
