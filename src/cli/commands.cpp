#include "wslgate/cli/commands.hpp"
#include "wslgate/core/logger.hpp"
#include "wslgate/core/utils.hpp"

#include <csignal>
#include <iostream>
#include <memory>

#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include "wslgate/exec/process_runner.hpp"
#include "wslgate/gateway/command_gateway.hpp"
#include "wslgate/gateway/confirmation_store.hpp"
#include "wslgate/gateway/mcp_handler.hpp"
#include "wslgate/gateway/protocol.hpp"
#include "wslgate/gateway/stdio_server.hpp"
#include "wslgate/infra/danger_classifier.hpp"
#include "wslgate/infra/exec_safety.hpp"
#include "wslgate/tools/tool_registry.hpp"
#include "wslgate/tools/wsl_tools.hpp"

#ifndef WSLGATE_VERSION_STRING
#define WSLGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace wslgate::cli {

using json = nlohmann::json;

namespace {

struct ServeOptions {
    std::string shell;
    bool local = false;
    int64_t default_timeout_ms = -1;
};

void fail_on_invalid(const Config& config) {
    auto valid = validate_config(config);
    if (!valid) {
        std::cerr << "Invalid configuration: " << valid.error().what() << "\n";
        throw CLI::RuntimeError(1);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("serve", "Run the MCP server on stdio");
    auto opts = std::make_shared<ServeOptions>();

    sub->add_option("--shell", opts->shell, "Shell invoked as <shell> -c <line>");
    sub->add_flag("--local", opts->local,
                  "Run the shell directly instead of through the WSL launcher");
    sub->add_option("--default-timeout", opts->default_timeout_ms,
                    "Timeout in ms for requests that carry none (0 = none)");

    sub->callback([&config, opts]() {
        // Apply CLI overrides.
        if (!opts->shell.empty()) config.shell.shell = opts->shell;
        if (opts->local) config.shell.launcher.clear();
        if (opts->default_timeout_ms >= 0) {
            config.shell.default_timeout_ms = opts->default_timeout_ms;
        }
        fail_on_invalid(config);

        // A client closing its end must surface as a write error, not a signal.
        std::signal(SIGPIPE, SIG_IGN);

        LOG_INFO("Starting {} (launcher: [{}], shell: {})", config.server.name,
                 utils::join(config.shell.launcher, " "), config.shell.shell);

        boost::asio::io_context ioc;
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc](auto ec, auto /*sig*/) {
            if (!ec) {
                LOG_INFO("Received shutdown signal");
                ioc.stop();
            }
        });

        exec::ShellProcessRunner runner(config.shell);
        gateway::InMemoryConfirmationStore store(config.confirmations);
        gateway::CommandGateway command_gateway(
            runner, store,
            infra::DangerClassifier::with_extra(config.shell.extra_dangerous_commands));

        tools::ToolRegistry registry;
        tools::register_wsl_tools(registry, command_gateway);
        LOG_INFO("Registered {} tools", registry.size());

        auto protocol = std::make_shared<gateway::Protocol>();
        gateway::register_mcp_handlers(*protocol, registry, config.server);

        gateway::StdioServer server(ioc, protocol, STDIN_FILENO, STDOUT_FILENO);
        boost::asio::co_spawn(ioc, server.run(),
            [&ioc, &signals](std::exception_ptr ep) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Server stopped with error: {}", e.what());
                    }
                }
                signals.cancel();
                ioc.stop();
            });

        ioc.run();
        LOG_INFO("Server stopped, {} confirmation(s) still pending", store.size());
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("check",
        "Show how a command would be sanitized and classified (nothing is run)");
    auto command = std::make_shared<std::string>();
    sub->add_option("command", *command, "Command line to inspect")->required();

    sub->callback([&config, command]() {
        auto validated = infra::validate_request(CommandRequest{.raw_command = *command});
        if (!validated) {
            std::cout << "Rejected: " << validated.error().what() << "\n";
            throw CLI::RuntimeError(1);
        }

        auto classifier =
            infra::DangerClassifier::with_extra(config.shell.extra_dangerous_commands);
        const auto& sanitized = validated->command.str();
        std::cout << "Sanitized: " << sanitized << "\n";
        if (auto token = classifier.first_match(sanitized)) {
            std::cout << "Verdict: requires confirmation (matched '" << *token << "')\n";
        } else {
            std::cout << "Verdict: runs immediately\n";
        }
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");
    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Only validate the configuration, don't print it");

    sub->callback([&config, validate_only]() {
        if (*validate_only) {
            fail_on_invalid(config);
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = config;
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "wslgate " << WSLGATE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace wslgate::cli
