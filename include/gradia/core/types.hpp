#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace gradia {

using json = nlohmann::json;

enum class Weekday {
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Weekday, {
    {Weekday::Monday, "Monday"},
    {Weekday::Tuesday, "Tuesday"},
    {Weekday::Wednesday, "Wednesday"},
    {Weekday::Thursday, "Thursday"},
    {Weekday::Friday, "Friday"},
})

inline constexpr std::size_t kWeekdayCount = 5;

/// Maps a timetable column index onto a weekday; nullopt past Friday.
auto weekday_from_index(std::size_t index) -> std::optional<Weekday>;
auto weekday_name(Weekday day) -> std::string_view;

/// One structured schedule record extracted from a rendered timetable.
struct TimetableEntry {
    Weekday day = Weekday::Monday;
    std::string name;
    std::string start_time;  // "HH:MM", 24h
    std::string end_time;    // "HH:MM", 24h
    std::string place;
    std::string instructor;

    auto operator==(const TimetableEntry&) const -> bool = default;
};

void to_json(json& j, const TimetableEntry& e);
void from_json(const json& j, TimetableEntry& e);

/// One logical scrape job.
struct ParseRequest {
    std::string url;
    int max_retries = 2;
    std::chrono::milliseconds navigation_timeout{10000};
};

} // namespace gradia
