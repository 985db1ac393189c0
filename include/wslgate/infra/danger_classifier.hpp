#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace wslgate::infra {

/// Decides whether a command needs explicit confirmation before it runs.
///
/// A command is dangerous when, for any listed token, the lowercased
/// command contains the lowercased token, or the command matches the token
/// as a standalone word (case-insensitive). The test is deliberately loose:
/// `cat summary.txt` is flagged because it contains `su`.
class DangerClassifier {
public:
    DangerClassifier();
    explicit DangerClassifier(std::vector<std::string> tokens);

    /// Built-in ordered token list: destructive file ops, privilege
    /// escalation, package managers, service and mount control, output
    /// redirection.
    [[nodiscard]] static auto default_tokens() -> const std::vector<std::string>&;

    /// Built-in list followed by `extra` (blank entries skipped).
    [[nodiscard]] static auto with_extra(const std::vector<std::string>& extra)
        -> DangerClassifier;

    [[nodiscard]] auto is_dangerous(std::string_view command) const -> bool;

    /// First token that flags `command`, in list order.
    [[nodiscard]] auto first_match(std::string_view command) const
        -> std::optional<std::string>;

    [[nodiscard]] auto tokens() const -> std::vector<std::string>;

private:
    struct Entry {
        std::string token;
        std::string lowered;
        std::regex word;
    };

    std::vector<Entry> entries_;
};

} // namespace wslgate::infra
