#pragma once

#include <CLI/CLI.hpp>

#include "wslgate/core/config.hpp"

namespace wslgate::cli {

/// Register the `serve` subcommand.
/// Runs the MCP server on stdin/stdout until input closes or a signal arrives.
void register_serve_command(CLI::App& app, Config& config);

/// Register the `check` subcommand.
/// Sanitizes and classifies a command without running it.
void register_check_command(CLI::App& app, Config& config);

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
void register_config_command(CLI::App& app, Config& config);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace wslgate::cli
