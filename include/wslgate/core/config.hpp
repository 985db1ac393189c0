#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wslgate/core/types.hpp"

// std::optional serializer for nlohmann/json. Lets the NLOHMANN_DEFINE
// macros handle optional fields (null <-> nullopt).
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace wslgate {

/// Largest accepted timeout (2^31 - 1 ms, about 24.8 days).
inline constexpr int64_t kMaxTimeoutMs = 2'147'483'647;

/// Shortest confirmation token the store will generate.
inline constexpr size_t kMinTokenLength = 6;

struct ShellConfig {
    // Prefix argv placed before the shell. Empty = run the shell locally.
    std::vector<std::string> launcher = {"wsl.exe", "--exec"};
    std::string shell = "bash";
    std::optional<int64_t> default_timeout_ms;  // used only when a request has none
    std::vector<std::string> extra_dangerous_commands;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ShellConfig, launcher, shell, default_timeout_ms, extra_dangerous_commands)

struct ConfirmationConfig {
    size_t token_length = 12;
    size_t pending_warn_threshold = 100;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ConfirmationConfig, token_length, pending_warn_threshold)

struct ServerConfig {
    std::string name = "wslgate";
    std::string version;  // empty = build version
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfig, name, version)

struct Config {
    ShellConfig shell;
    ConfirmationConfig confirmations;
    ServerConfig server;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, shell, confirmations, server, log_level)

/// Loads a JSON config file. A missing or malformed file logs a warning
/// and yields defaults.
auto load_config(const std::filesystem::path& path) -> Config;

/// Applies WSLGATE_* environment overrides on top of `base`.
auto apply_env_overrides(Config base) -> Config;

auto default_config() -> Config;

/// Structural checks that JSON parsing cannot express.
auto validate_config(const Config& config) -> VoidResult;

} // namespace wslgate
