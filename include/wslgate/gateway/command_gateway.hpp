#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "wslgate/core/error.hpp"
#include "wslgate/core/types.hpp"
#include "wslgate/exec/process_runner.hpp"
#include "wslgate/gateway/confirmation_store.hpp"
#include "wslgate/infra/danger_classifier.hpp"

namespace wslgate::gateway {

using boost::asio::awaitable;

/// Text handed back to the tool layer.
struct Reply {
    std::string text;
    bool is_error = false;
};

/// Renders an ExecutionResult as the multi-line block callers see.
auto format_result(const ExecutionResult& result) -> std::string;

/// Prompt returned when a command is parked awaiting confirmation.
auto confirmation_prompt(std::string_view command, std::string_view token) -> std::string;

inline constexpr std::string_view kCancelledText = "Command execution cancelled.";

/// Validate -> classify -> park-or-run orchestration.
///
/// A dangerous command is never run by `submit`: it is parked in the
/// ConfirmationStore and the call returns immediately with
/// `requires_confirmation = true`. A later, independent `resume` with the
/// token either runs it or drops it.
class CommandGateway {
public:
    CommandGateway(exec::CommandRunner& runner,
                   ConfirmationStore& store,
                   infra::DangerClassifier classifier = infra::DangerClassifier());

    CommandGateway(const CommandGateway&) = delete;
    CommandGateway& operator=(const CommandGateway&) = delete;

    /// First phase. Fails with ValidationFailed before anything is parked
    /// or spawned.
    auto submit(const CommandRequest& request) -> awaitable<Result<ExecutionResult>>;

    /// Second phase. Consumes `token`; returns nullopt when `approve` is
    /// false (nothing is spawned).
    auto resume(std::string_view token, bool approve)
        -> awaitable<Result<std::optional<ExecutionResult>>>;

    /// Runs a fixed read-only template without classification. The template
    /// must already be safe; only caller-supplied fragments inside it need
    /// infra::sanitize_argument.
    auto run_trusted(std::string command_template) -> awaitable<Result<ExecutionResult>>;

    auto execute(CommandRequest request) -> awaitable<Reply>;
    auto confirm(std::string token, bool approve) -> awaitable<Reply>;
    auto run_readonly(std::string command_template) -> awaitable<Reply>;

    [[nodiscard]] auto classifier() const noexcept -> const infra::DangerClassifier& {
        return classifier_;
    }
    [[nodiscard]] auto store() noexcept -> ConfirmationStore& { return store_; }

private:
    exec::CommandRunner& runner_;
    ConfirmationStore& store_;
    infra::DangerClassifier classifier_;
};

} // namespace wslgate::gateway
