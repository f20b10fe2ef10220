#include "gradia/timetable/extractor.hpp"
#include "gradia/core/logger.hpp"
#include "gradia/core/utils.hpp"

#include <charconv>
#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace gradia::timetable {

using browser::DomNode;
using browser::Selector;
using browser::parse_inline_style;

namespace {

constexpr int kMinutesPerDay = 24 * 60;

/// Trimmed text of the first match, or the placeholder when absent or blank.
auto field_or(const Selector& selector, const DomNode& block, const char* placeholder)
    -> std::string {
    const auto* node = selector.select_one(block);
    if (!node) return placeholder;
    auto text = utils::trim(node->text_content());
    return text.empty() ? std::string(placeholder) : text;
}

} // anonymous namespace

auto parse_px(std::string_view value) -> std::optional<double> {
    auto v = utils::trim(value);
    if (utils::ends_with(utils::to_lower(v), "px")) {
        v = utils::trim(std::string_view(v).substr(0, v.size() - 2));
    }
    if (v.empty()) return std::nullopt;

    double result = 0.0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), result);
    if (ec != std::errc{} || ptr != v.data() + v.size()) return std::nullopt;
    if (!std::isfinite(result) || result < 0.0) return std::nullopt;
    return result;
}

// ---------------------------------------------------------------------------
// Extractor
// ---------------------------------------------------------------------------

Extractor::Extractor(ExtractorOptions options, Selector day, Selector subject,
                     Selector name, Selector place, Selector instructor)
    : options_(std::move(options)),
      day_(std::move(day)),
      subject_(std::move(subject)),
      name_(std::move(name)),
      place_(std::move(place)),
      instructor_(std::move(instructor)) {}

auto Extractor::create(ExtractorOptions options) -> Result<Extractor> {
    if (options.pixels_per_hour <= 0) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "pixels_per_hour must be positive",
                       std::to_string(options.pixels_per_hour)));
    }

    auto day = Selector::parse(options.day_selector);
    if (!day) return std::unexpected(day.error());
    auto subject = Selector::parse(options.subject_selector);
    if (!subject) return std::unexpected(subject.error());
    auto name = Selector::parse(options.name_selector);
    if (!name) return std::unexpected(name.error());
    auto place = Selector::parse(options.place_selector);
    if (!place) return std::unexpected(place.error());
    auto instructor = Selector::parse(options.instructor_selector);
    if (!instructor) return std::unexpected(instructor.error());

    return Extractor(std::move(options), std::move(*day), std::move(*subject),
                     std::move(*name), std::move(*place), std::move(*instructor));
}

auto Extractor::format_offset(double px) const -> std::optional<std::string> {
    // Range-check before rounding; lround/int would wrap huge offsets.
    auto exact = px * 60.0 / options_.pixels_per_hour;
    if (!std::isfinite(exact) || exact < 0.0 || exact > kMinutesPerDay) {
        return std::nullopt;
    }
    auto minutes = static_cast<int>(std::lround(exact));
    if (minutes > kMinutesPerDay) return std::nullopt;
    return fmt::format("{:02d}:{:02d}", minutes / 60, minutes % 60);
}

auto Extractor::extract_block(const DomNode& block, Weekday day) const
    -> Result<TimetableEntry> {
    auto style = parse_inline_style(block.attribute("style").value_or(""));

    auto top_it = style.find("top");
    auto height_it = style.find("height");
    if (top_it == style.end() || height_it == style.end()) {
        return std::unexpected(
            make_error(ErrorCode::ExtractionError,
                       "Subject block has no position metadata",
                       block.attribute("style").value_or("<no style>")));
    }

    auto top = parse_px(top_it->second);
    auto height = parse_px(height_it->second);
    if (!top || !height) {
        return std::unexpected(
            make_error(ErrorCode::ExtractionError,
                       "Subject block has unreadable position metadata",
                       "top=" + top_it->second + " height=" + height_it->second));
    }

    auto start = format_offset(*top);
    auto end = format_offset(*top + *height);
    if (!start || !end) {
        return std::unexpected(
            make_error(ErrorCode::ExtractionError,
                       "Subject block lies outside the day",
                       "top=" + top_it->second + " height=" + height_it->second));
    }

    TimetableEntry entry;
    entry.day = day;
    entry.name = field_or(name_, block, kUnknownSubject);
    entry.start_time = std::move(*start);
    entry.end_time = std::move(*end);
    entry.place = field_or(place_, block, kPlaceTba);
    entry.instructor = field_or(instructor_, block, kInstructorTba);
    return entry;
}

auto Extractor::extract(const DomNode& document) const
    -> Result<std::vector<TimetableEntry>> {
    auto columns = day_.select(document);
    if (columns.empty()) {
        return std::unexpected(
            make_error(ErrorCode::EmptyTimetable, "Timetable columns not found",
                       std::string(day_.text())));
    }

    std::vector<TimetableEntry> entries;
    // Every column consumes a weekday, empty or not.
    for (size_t index = 0; index < columns.size(); ++index) {
        auto day = weekday_from_index(index);
        if (!day) break;

        for (const auto* block : subject_.select(*columns[index])) {
            auto entry = extract_block(*block, *day);
            if (!entry) return std::unexpected(entry.error());
            entries.push_back(std::move(*entry));
        }
    }

    if (entries.empty()) {
        return std::unexpected(
            make_error(ErrorCode::EmptyTimetable, "Timetable has no subject blocks",
                       std::to_string(columns.size()) + " columns"));
    }

    LOG_DEBUG("Extracted {} timetable entries from {} columns", entries.size(),
              columns.size());
    return entries;
}

} // namespace gradia::timetable
