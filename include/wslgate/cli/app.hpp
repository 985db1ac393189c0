#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "wslgate/core/config.hpp"

namespace wslgate::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration
/// (file, then WSLGATE_* environment, then flags) and dispatches to the
/// selected subcommand (serve, check, config, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    /// Runs after parsing, before any subcommand callback.
    void load_configuration();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
};

} // namespace wslgate::cli
