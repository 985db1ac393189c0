#include "wslgate/gateway/command_gateway.hpp"

#include "wslgate/core/logger.hpp"
#include "wslgate/core/utils.hpp"
#include "wslgate/infra/exec_safety.hpp"

#include <exception>
#include <vector>

namespace wslgate::gateway {

auto format_result(const ExecutionResult& result) -> std::string {
    std::vector<std::string> lines;
    lines.push_back("Command: " + result.command);
    if (result.working_dir && !result.working_dir->empty()) {
        lines.push_back("Working Directory: " + *result.working_dir);
    }
    lines.push_back("Exit Code: " +
        (result.exit_code ? std::to_string(*result.exit_code) : std::string("null")));

    auto out = utils::trim(result.stdout_text);
    lines.push_back(out.empty() ? std::string("No output") : "Output:\n" + out);

    auto err = utils::trim(result.stderr_text);
    lines.push_back(err.empty() ? std::string("No errors") : "Errors:\n" + err);

    if (result.error && !result.error->empty()) {
        lines.push_back("Error: " + *result.error);
    }

    return utils::join(lines, "\n");
}

auto confirmation_prompt(std::string_view command, std::string_view token) -> std::string {
    return "Command \"" + std::string(command) +
           "\" requires confirmation. Use confirm_command with ID: " + std::string(token);
}

CommandGateway::CommandGateway(exec::CommandRunner& runner,
                               ConfirmationStore& store,
                               infra::DangerClassifier classifier)
    : runner_(runner), store_(store), classifier_(std::move(classifier)) {}

auto CommandGateway::submit(const CommandRequest& request)
    -> awaitable<Result<ExecutionResult>> {
    auto validated = infra::validate_request(request);
    if (!validated) {
        LOG_WARN("Rejected command '{}': {}", request.raw_command, validated.error().what());
        co_return make_fail(validated.error());
    }

    if (classifier_.is_dangerous(validated->command.str())) {
        auto command = validated->command.str();
        auto working_dir = validated->working_dir;
        auto token = store_.park(std::move(*validated));

        co_return ExecutionResult{
            .stdout_text = "",
            .stderr_text = confirmation_prompt(command, token),
            .exit_code = std::nullopt,
            .command = command,
            .working_dir = std::move(working_dir),
            .requires_confirmation = true,
            .error = std::nullopt,
            .confirmation_id = token,
        };
    }

    co_return co_await runner_.run(validated->command,
                                   validated->working_dir,
                                   validated->timeout_ms);
}

auto CommandGateway::resume(std::string_view token, bool approve)
    -> awaitable<Result<std::optional<ExecutionResult>>> {
    auto pending = store_.consume(token);
    if (!pending) {
        LOG_WARN("Confirmation failed for token '{}'", token);
        co_return make_fail(pending.error());
    }

    if (!approve) {
        LOG_INFO("Confirmation {} rejected; '{}' dropped",
                 pending->token, pending->request.command.str());
        co_return std::optional<ExecutionResult>{};
    }

    LOG_INFO("Confirmation {} approved; running '{}'",
             pending->token, pending->request.command.str());
    auto& req = pending->request;
    auto result = co_await runner_.run(req.command, req.working_dir, req.timeout_ms);
    if (!result) {
        co_return make_fail(result.error());
    }
    co_return std::optional<ExecutionResult>(std::move(*result));
}

auto CommandGateway::run_trusted(std::string command_template)
    -> awaitable<Result<ExecutionResult>> {
    auto command = SanitizedCommand::make(utils::trim(command_template));
    if (!command) {
        co_return make_fail(command.error());
    }
    co_return co_await runner_.run(*command, std::nullopt, std::nullopt);
}

auto CommandGateway::execute(CommandRequest request) -> awaitable<Reply> {
    try {
        auto result = co_await submit(request);
        if (!result) {
            co_return Reply{"Error executing command: " + std::string(result.error().message()), true};
        }
        if (result->requires_confirmation.value_or(false)) {
            co_return Reply{result->stderr_text, false};
        }
        co_return Reply{format_result(*result), false};
    } catch (const std::exception& e) {
        LOG_ERROR("execute threw: {}", e.what());
        co_return Reply{"Error executing command: " + std::string(e.what()), true};
    }
}

auto CommandGateway::confirm(std::string token, bool approve) -> awaitable<Reply> {
    try {
        auto result = co_await resume(token, approve);
        if (!result) {
            co_return Reply{"Error confirming command: " + std::string(result.error().message()), true};
        }
        if (!result->has_value()) {
            co_return Reply{std::string(kCancelledText), false};
        }
        co_return Reply{format_result(**result), false};
    } catch (const std::exception& e) {
        LOG_ERROR("confirm threw: {}", e.what());
        co_return Reply{"Error confirming command: " + std::string(e.what()), true};
    }
}

auto CommandGateway::run_readonly(std::string command_template) -> awaitable<Reply> {
    try {
        auto result = co_await run_trusted(std::move(command_template));
        if (!result) {
            co_return Reply{"Error: " + std::string(result.error().message()), true};
        }
        co_return Reply{format_result(*result), false};
    } catch (const std::exception& e) {
        LOG_ERROR("read-only command threw: {}", e.what());
        co_return Reply{"Error: " + std::string(e.what()), true};
    }
}

} // namespace wslgate::gateway
