#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "wslgate/core/error.hpp"
#include "wslgate/core/types.hpp"

namespace wslgate::infra {

/// Shell metacharacters that enable chaining or substitution.
inline constexpr std::string_view kShellMetacharacters = ";&|`$";

/// Removes shell metacharacters, normalizes backslashes to forward slashes,
/// strips every `..` and `~`, then trims. Fails with ValidationFailed when
/// nothing is left.
///
/// This is a denylist, not a shell parser: a file name that legitimately
/// contains `..` or `~` is mangled too.
auto sanitize_command(std::string_view command) -> Result<SanitizedCommand>;

/// Same metacharacter and backslash handling as sanitize_command, without
/// the `..`/`~` stripping. Absent or empty input means "no working
/// directory"; input that sanitizes to nothing is rejected.
auto validate_working_dir(const std::optional<std::string>& working_dir)
    -> Result<std::optional<std::string>>;

/// Rejects non-finite and negative values. Absent or zero means "no
/// timeout"; fractional milliseconds round up.
auto validate_timeout(std::optional<double> timeout_ms)
    -> Result<std::optional<int64_t>>;

/// Runs all three validators over a request.
auto validate_request(const CommandRequest& request) -> Result<ValidatedCommand>;

/// Sanitizes a caller-supplied fragment that is quoted into a fixed command
/// template. Applies the sanitize_command rules and also drops `"` so the
/// fragment cannot close its quotes. May return an empty string.
auto sanitize_argument(std::string_view fragment) -> std::string;

} // namespace wslgate::infra
