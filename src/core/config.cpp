#include "wslgate/core/config.hpp"
#include "wslgate/core/logger.hpp"
#include "wslgate/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace wslgate {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto apply_env_overrides(Config base) -> Config {
    if (auto* val = std::getenv("WSLGATE_LOG_LEVEL")) {
        base.log_level = val;
    }
    if (auto* val = std::getenv("WSLGATE_SHELL")) {
        base.shell.shell = val;
    }
    if (auto* val = std::getenv("WSLGATE_LAUNCHER")) {
        base.shell.launcher.clear();
        for (auto& part : utils::split(val, ' ')) {
            if (!part.empty()) base.shell.launcher.push_back(std::move(part));
        }
    }
    if (auto* val = std::getenv("WSLGATE_DEFAULT_TIMEOUT_MS")) {
        try {
            base.shell.default_timeout_ms = std::stoll(val);
        } catch (const std::exception& e) {
            LOG_WARN("Ignoring WSLGATE_DEFAULT_TIMEOUT_MS='{}': {}", val, e.what());
        }
    }
    return base;
}

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const Config& config) -> VoidResult {
    if (config.shell.shell.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "shell.shell must not be empty"));
    }
    if (config.shell.default_timeout_ms && *config.shell.default_timeout_ms < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "shell.default_timeout_ms must be non-negative",
            std::to_string(*config.shell.default_timeout_ms)));
    }
    if (config.shell.default_timeout_ms && *config.shell.default_timeout_ms > kMaxTimeoutMs) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "shell.default_timeout_ms is too large",
            std::to_string(*config.shell.default_timeout_ms)));
    }
    if (config.confirmations.token_length < kMinTokenLength) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "confirmations.token_length must be at least " + std::to_string(kMinTokenLength),
            std::to_string(config.confirmations.token_length)));
    }
    for (const auto& token : config.shell.extra_dangerous_commands) {
        if (utils::trim(token).empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "shell.extra_dangerous_commands contains an empty entry"));
        }
    }
    return {};
}

} // namespace wslgate
