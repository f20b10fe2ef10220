#include "gradia/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <random>

namespace gradia::utils {

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.starts_with(prefix);
}

auto ends_with(std::string_view s, std::string_view suffix) -> bool {
    return s.ends_with(suffix);
}

auto truncate_utf8(std::string_view s, std::size_t max_bytes) -> std::string {
    if (s.size() <= max_bytes) return std::string(s);
    auto end = max_bytes;
    // Back off continuation bytes (10xxxxxx) to the lead byte of the cut sequence.
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
        --end;
    }
    return std::string(s.substr(0, end));
}

auto parse_int(std::string_view s) -> std::optional<int> {
    auto trimmed = trim(s);
    if (trimmed.empty()) return std::nullopt;

    int value = 0;
    const auto* first = trimmed.data();
    const auto* last = trimmed.data() + trimmed.size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

auto env_int(const char* name) -> std::optional<int> {
    const auto* val = std::getenv(name);
    if (!val) return std::nullopt;
    auto parsed = parse_int(val);
    if (!parsed || *parsed < 0) return std::nullopt;
    return parsed;
}

auto env_bool(const char* name) -> std::optional<bool> {
    const auto* val = std::getenv(name);
    if (!val) return std::nullopt;
    auto v = to_lower(trim(val));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

} // namespace gradia::utils
