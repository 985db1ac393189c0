#include "wslgate/infra/danger_classifier.hpp"

#include "wslgate/core/logger.hpp"
#include "wslgate/core/utils.hpp"

namespace wslgate::infra {

namespace {

auto escape_regex(std::string_view token) -> std::string {
    static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(token.size() * 2);
    for (char c : token) {
        if (special.find(c) != std::string_view::npos) out += '\\';
        out += c;
    }
    return out;
}

} // anonymous namespace

auto DangerClassifier::default_tokens() -> const std::vector<std::string>& {
    static const std::vector<std::string> tokens = {
        "rm", "rmdir", "dd", "mkfs", "mkswap", "fdisk", "shutdown", "reboot",
        ">",   // redirect that could overwrite
        ">>",  // append redirect
        "format", "chmod", "chown", "sudo", "su", "passwd", "mv",
        "find -delete", "truncate", "shred", "kill", "pkill",
        "service", "systemctl", "mount", "umount",
        "apt", "apt-get", "dpkg", "yum", "dnf", "pacman",
    };
    return tokens;
}

DangerClassifier::DangerClassifier()
    : DangerClassifier(default_tokens()) {}

DangerClassifier::DangerClassifier(std::vector<std::string> tokens) {
    entries_.reserve(tokens.size());
    for (auto& token : tokens) {
        auto pattern = "\\b" + escape_regex(token) + "\\b";
        auto lowered = utils::to_lower(token);
        entries_.push_back(Entry{
            .token = std::move(token),
            .lowered = std::move(lowered),
            .word = std::regex(pattern, std::regex::ECMAScript | std::regex::icase),
        });
    }
}

auto DangerClassifier::with_extra(const std::vector<std::string>& extra)
    -> DangerClassifier {
    auto tokens = default_tokens();
    for (const auto& token : extra) {
        auto trimmed = utils::trim(token);
        if (!trimmed.empty()) tokens.push_back(std::move(trimmed));
    }
    return DangerClassifier(std::move(tokens));
}

auto DangerClassifier::is_dangerous(std::string_view command) const -> bool {
    return first_match(command).has_value();
}

auto DangerClassifier::first_match(std::string_view command) const
    -> std::optional<std::string> {
    auto lowered = utils::to_lower(command);
    auto text = std::string(command);

    for (const auto& entry : entries_) {
        if (lowered.find(entry.lowered) != std::string::npos ||
            std::regex_search(text, entry.word)) {
            LOG_DEBUG("Command '{}' flagged by token '{}'", command, entry.token);
            return entry.token;
        }
    }
    return std::nullopt;
}

auto DangerClassifier::tokens() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.token);
    }
    return out;
}

} // namespace wslgate::infra
