#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gradia/browser/dom.hpp"
#include "gradia/core/error.hpp"
#include "gradia/core/types.hpp"

namespace gradia::timetable {

inline constexpr const char* kUnknownSubject = "Unknown subject";
inline constexpr const char* kPlaceTba = "Place TBA";
inline constexpr const char* kInstructorTba = "Instructor TBA";

struct ExtractorOptions {
    int pixels_per_hour = 60;
    std::string day_selector = ".wrap .tablebody .tablebody td";
    std::string subject_selector = ".subject";
    std::string name_selector = "h3";
    std::string place_selector = "p span";
    std::string instructor_selector = "em";
};

/// Turns a rendered timetable document into schedule entries.
///
/// Day columns map to Monday..Friday by position. A block's vertical offset
/// and height (inline style, px) encode its start time and duration.
class Extractor {
public:
    static auto create(ExtractorOptions options = {}) -> Result<Extractor>;

    /// EmptyTimetable when no column or no block is found (worth a retry),
    /// ExtractionError when a block's geometry cannot be interpreted.
    [[nodiscard]] auto extract(const browser::DomNode& document) const
        -> Result<std::vector<TimetableEntry>>;

    /// Converts a pixel offset into "HH:MM" at the configured scale.
    /// nullopt for offsets past 24:00.
    [[nodiscard]] auto format_offset(double px) const -> std::optional<std::string>;

    [[nodiscard]] auto options() const -> const ExtractorOptions& { return options_; }

private:
    Extractor(ExtractorOptions options, browser::Selector day, browser::Selector subject,
              browser::Selector name, browser::Selector place,
              browser::Selector instructor);

    auto extract_block(const browser::DomNode& block, Weekday day) const
        -> Result<TimetableEntry>;

    ExtractorOptions options_;
    browser::Selector day_;
    browser::Selector subject_;
    browser::Selector name_;
    browser::Selector place_;
    browser::Selector instructor_;
};

/// Parses a CSS pixel length such as "540px" or "62.5px".
auto parse_px(std::string_view value) -> std::optional<double>;

} // namespace gradia::timetable
