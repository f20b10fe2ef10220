#include "gradia/core/types.hpp"

namespace gradia {

namespace {

constexpr std::array<std::string_view, kWeekdayCount> kWeekdayNames = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday",
};

} // anonymous namespace

auto weekday_from_index(std::size_t index) -> std::optional<Weekday> {
    if (index >= kWeekdayCount) return std::nullopt;
    return static_cast<Weekday>(index);
}

auto weekday_name(Weekday day) -> std::string_view {
    return kWeekdayNames[static_cast<std::size_t>(day)];
}

void to_json(json& j, const TimetableEntry& e) {
    j = json{
        {"day", e.day},
        {"name", e.name},
        {"startTime", e.start_time},
        {"endTime", e.end_time},
        {"place", e.place},
        {"instructor", e.instructor},
    };
}

void from_json(const json& j, TimetableEntry& e) {
    j.at("day").get_to(e.day);
    j.at("name").get_to(e.name);
    j.at("startTime").get_to(e.start_time);
    j.at("endTime").get_to(e.end_time);
    e.place = j.value("place", "");
    e.instructor = j.value("instructor", "");
}

} // namespace gradia
