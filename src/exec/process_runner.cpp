#include "wslgate/exec/process_runner.hpp"

#include "wslgate/core/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace wslgate::exec {

namespace net = boost::asio;

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(5);

struct SpawnedChild {
    pid_t pid = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

auto close_pair(int fds[2]) -> void {
    ::close(fds[0]);
    ::close(fds[1]);
}

/// Launches argv with stdin on /dev/null, stdout/stderr on fresh pipes and
/// the child leading its own process group.
auto spawn_child(const std::vector<std::string>& argv) -> Result<SpawnedChild> {
    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return std::unexpected(make_error(ErrorCode::IoError,
            std::string("Failed to create stdout pipe: ") + std::strerror(errno)));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        auto saved = errno;
        close_pair(out_pipe);
        return std::unexpected(make_error(ErrorCode::IoError,
            std::string("Failed to create stderr pipe: ") + std::strerror(saved)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    if (posix_spawn_file_actions_init(&actions) != 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        return std::unexpected(make_error(ErrorCode::SpawnFailed,
            "Failed to initialise spawn file actions"));
    }
    if (posix_spawnattr_init(&attr) != 0) {
        posix_spawn_file_actions_destroy(&actions);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return std::unexpected(make_error(ErrorCode::SpawnFailed,
            "Failed to initialise spawn attributes"));
    }

    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

    // New process group so a timeout can take down everything the shell
    // started; default SIGPIPE in case the gateway itself ignores it.
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setflags(&attr,
        POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setsigmask(&attr, &empty_mask);

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, c_argv[0], &actions, &attr, c_argv.data(), environ);

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    if (rc != 0) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        return std::unexpected(make_error(ErrorCode::SpawnFailed,
            "Failed to launch " + argv.front() + ": " + std::strerror(rc)));
    }

    return SpawnedChild{.pid = pid, .stdout_fd = out_pipe[0], .stderr_fd = err_pipe[0]};
}

/// State shared between the run coroutine, the two stream readers and the
/// deadline handler. Every party holds a shared_ptr, so completion
/// handlers that fire after run() returned stay valid.
struct RunState {
    RunState(const net::any_io_executor& ex, const SpawnedChild& child)
        : pid(child.pid),
          stdout_stream(ex, child.stdout_fd),
          stderr_stream(ex, child.stderr_fd),
          streams_closed(ex),
          deadline(ex) {
        streams_closed.expires_at(net::steady_timer::time_point::max());
    }

    pid_t pid;
    net::posix::stream_descriptor stdout_stream;
    net::posix::stream_descriptor stderr_stream;
    std::string stdout_text;
    std::string stderr_text;
    int open_streams = 2;
    bool reaped = false;
    bool timed_out = false;
    net::steady_timer streams_closed;  // cancelled when both streams hit EOF
    net::steady_timer deadline;
};

auto drain(std::shared_ptr<RunState> state,
           net::posix::stream_descriptor& stream,
           std::string& sink) -> awaitable<void> {
    std::array<char, 4096> buffer{};
    for (;;) {
        boost::system::error_code ec;
        auto n = co_await stream.async_read_some(
            net::buffer(buffer), net::redirect_error(net::use_awaitable, ec));
        sink.append(buffer.data(), n);
        if (ec) {
            if (ec != net::error::eof) {
                LOG_DEBUG("Stream read for pid {} ended: {}", state->pid, ec.message());
            }
            break;
        }
    }

    if (--state->open_streams == 0) {
        state->streams_closed.cancel();
    }
}

/// Waits for the child to exit without blocking the executor.
auto reap(std::shared_ptr<RunState> state) -> awaitable<int> {
    net::steady_timer poll(co_await net::this_coro::executor);
    for (;;) {
        int status = 0;
        auto rc = ::waitpid(state->pid, &status, WNOHANG);
        if (rc == state->pid) {
            co_return status;
        }
        if (rc < 0 && errno != EINTR) {
            LOG_WARN("waitpid({}) failed: {}", state->pid, std::strerror(errno));
            co_return -1;
        }
        poll.expires_after(kReapPollInterval);
        boost::system::error_code ec;
        co_await poll.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

} // anonymous namespace

auto compose_command_line(const SanitizedCommand& command,
                          const std::optional<std::string>& working_dir)
    -> std::string {
    if (!working_dir) {
        return command.str();
    }
    return "cd \"" + *working_dir + "\" && " + command.str();
}

auto build_argv(const ShellConfig& config, std::string_view command_line)
    -> std::vector<std::string> {
    std::vector<std::string> argv = config.launcher;
    argv.push_back(config.shell);
    argv.emplace_back("-c");
    argv.emplace_back(command_line);
    return argv;
}

ShellProcessRunner::ShellProcessRunner(ShellConfig config)
    : config_(std::move(config)) {}

auto ShellProcessRunner::run(const SanitizedCommand& command,
                             std::optional<std::string> working_dir,
                             std::optional<int64_t> timeout_ms)
    -> awaitable<Result<ExecutionResult>> {
    if (!timeout_ms && config_.default_timeout_ms && *config_.default_timeout_ms > 0) {
        timeout_ms = config_.default_timeout_ms;
    }

    auto line = compose_command_line(command, working_dir);
    auto argv = build_argv(config_, line);

    auto child = spawn_child(argv);
    if (!child) {
        LOG_WARN("Spawn failed for '{}': {}", line, child.error().what());
        co_return make_fail(child.error());
    }
    LOG_DEBUG("Spawned pid {}: {}", child->pid, line);

    auto executor = co_await net::this_coro::executor;
    auto state = std::make_shared<RunState>(executor, *child);

    if (timeout_ms) {
        state->deadline.expires_after(
            std::chrono::milliseconds(std::min(*timeout_ms, kMaxTimeoutMs)));
        state->deadline.async_wait([state, ms = *timeout_ms](boost::system::error_code ec) {
            if (ec || state->reaped) return;
            state->timed_out = true;
            LOG_WARN("Command exceeded {}ms, killing process group {}", ms, state->pid);
            ::kill(-state->pid, SIGKILL);
            // A descendant that left the group can hold the pipes open.
            boost::system::error_code ignored;
            state->stdout_stream.close(ignored);
            state->stderr_stream.close(ignored);
        });
    }

    net::co_spawn(executor, drain(state, state->stdout_stream, state->stdout_text), net::detached);
    net::co_spawn(executor, drain(state, state->stderr_stream, state->stderr_text), net::detached);

    if (state->open_streams > 0) {
        boost::system::error_code ec;
        co_await state->streams_closed.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    auto status = co_await reap(state);
    state->reaped = true;
    state->deadline.cancel();

    if (state->timed_out) {
        co_return make_fail(make_error(ErrorCode::Timeout,
            "Command timed out after " + std::to_string(*timeout_ms) + "ms"));
    }

    std::optional<int> exit_code;
    if (status >= 0 && WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
    LOG_DEBUG("pid {} finished (exit={})", state->pid,
              exit_code ? std::to_string(*exit_code) : std::string("null"));

    co_return ExecutionResult{
        .stdout_text = std::move(state->stdout_text),
        .stderr_text = std::move(state->stderr_text),
        .exit_code = exit_code,
        .command = command.str(),
        .working_dir = std::move(working_dir),
        .requires_confirmation = std::nullopt,
        .error = std::nullopt,
        .confirmation_id = std::nullopt,
    };
}

} // namespace wslgate::exec
