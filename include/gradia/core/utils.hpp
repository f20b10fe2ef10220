#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradia::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto timestamp_ms() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto starts_with(std::string_view s, std::string_view prefix) -> bool;
auto ends_with(std::string_view s, std::string_view suffix) -> bool;

/// At most `max_bytes` of `s`, cut back so no UTF-8 sequence is split.
auto truncate_utf8(std::string_view s, std::size_t max_bytes) -> std::string;

/// Parses a base-10 integer occupying the whole of `s` (surrounding
/// whitespace allowed). Returns nullopt on any trailing garbage or overflow.
auto parse_int(std::string_view s) -> std::optional<int>;

/// Reads an environment variable as a non-negative integer.
auto env_int(const char* name) -> std::optional<int>;

/// Reads an environment variable as a boolean ("1"/"true"/"yes"/"on").
auto env_bool(const char* name) -> std::optional<bool>;

} // namespace gradia::utils
