#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "wslgate/core/config.hpp"
#include "wslgate/core/error.hpp"
#include "wslgate/core/types.hpp"

namespace wslgate::exec {

using boost::asio::awaitable;

/// `cd "<working_dir>" && <command>`, or just the command without a
/// working directory.
auto compose_command_line(const SanitizedCommand& command,
                          const std::optional<std::string>& working_dir)
    -> std::string;

/// launcher... shell -c <line>
auto build_argv(const ShellConfig& config, std::string_view command_line)
    -> std::vector<std::string>;

/// Runs a sanitized command in the foreign shell and collects its output.
///
/// Implementations launch exactly one process per call and never retry.
/// A timeout kills the process and fails with ErrorCode::Timeout instead of
/// returning partial output; a launch failure fails with
/// ErrorCode::SpawnFailed carrying the OS message.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual auto run(const SanitizedCommand& command,
                     std::optional<std::string> working_dir,
                     std::optional<int64_t> timeout_ms)
        -> awaitable<Result<ExecutionResult>> = 0;
};

/// CommandRunner backed by a real child process (posix_spawnp) whose
/// stdout and stderr are read asynchronously on the calling executor.
/// The executor must be single-threaded (or a strand).
class ShellProcessRunner : public CommandRunner {
public:
    explicit ShellProcessRunner(ShellConfig config);

    auto run(const SanitizedCommand& command,
             std::optional<std::string> working_dir,
             std::optional<int64_t> timeout_ms)
        -> awaitable<Result<ExecutionResult>> override;

    [[nodiscard]] auto config() const noexcept -> const ShellConfig& { return config_; }

private:
    ShellConfig config_;
};

} // namespace wslgate::exec
