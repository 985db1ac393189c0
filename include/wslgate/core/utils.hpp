#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wslgate::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto timestamp_ms() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// Replaces every occurrence of `from` in `s` with `to`.
auto replace_all(std::string s, std::string_view from, std::string_view to) -> std::string;

} // namespace wslgate::utils
