#include "wslgate/cli/app.hpp"
#include "wslgate/cli/commands.hpp"
#include "wslgate/core/logger.hpp"

#include <filesystem>

// Version string; injected by CMake via -DWSLGATE_VERSION_STRING=...
#ifndef WSLGATE_VERSION_STRING
#define WSLGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace wslgate::cli {

App::App()
    : cli_("wslgate", "Gated command execution for WSL over MCP stdio")
{
    cli_.set_version_flag("--version", WSLGATE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("WSLGATE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override. WSLGATE_LOG_LEVEL is applied with
    // the other environment overrides so the flag wins over it.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.require_subcommand(1);
    cli_.parse_complete_callback([this]() { load_configuration(); });

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::load_configuration() {
    if (!config_path_.empty()) {
        config_ = load_config(std::filesystem::path(config_path_));
    }
    config_ = apply_env_overrides(std::move(config_));
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }

    Logger::init("wslgate", config_.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path_);
    }
}

void App::setup_commands() {
    register_serve_command(cli_, config_);
    register_check_command(cli_, config_);
    register_config_command(cli_, config_);
    register_version_command(cli_);
}

} // namespace wslgate::cli
