#include <catch2/catch_test_macros.hpp>

#include <string>

#include "gradia/cli/commands.hpp"
#include "gradia/timetable/url_validator.hpp"

using gradia::ErrorCode;

TEST_CASE("render_result on success", "[cli]") {
    std::vector<gradia::TimetableEntry> entries = {
        {gradia::Weekday::Monday, "Operating Systems", "09:00", "10:30", "Eng-301", "Kim"},
    };
    gradia::Result<std::vector<gradia::TimetableEntry>> result = entries;

    auto j = gradia::cli::render_result("https://everytime.kr/@x", result);
    CHECK(j["url"] == "https://everytime.kr/@x");
    CHECK(j["message"] == "Timetable parsed successfully");
    REQUIRE(j["timetable"].size() == 1);
    CHECK(j["timetable"][0]["day"] == "Monday");
    CHECK(j["timetable"][0]["startTime"] == "09:00");
    CHECK_FALSE(j.contains("error"));
}

TEST_CASE("render_result on failure", "[cli]") {
    gradia::Result<std::vector<gradia::TimetableEntry>> result = std::unexpected(
        gradia::make_error(ErrorCode::EngineTimeout, "Timetable could not be loaded",
                           "attempts=3"));

    auto j = gradia::cli::render_result("https://everytime.kr/@x", result);
    CHECK_FALSE(j.contains("timetable"));
    CHECK(j["error"]["code"] == "ENGINE_TIMEOUT");
    CHECK(j["error"]["kind"] == "transient_engine");
    CHECK(j["error"]["status"] == 504);
    CHECK(j["error"]["detail"] == "attempts=3");
}

TEST_CASE("render_result of a rejected non-ASCII URL serializes", "[cli]") {
    // 18 ASCII bytes followed by 3-byte syllables: a raw 128-byte cut lands
    // inside a syllable.
    std::string url = "https://x.example/";
    for (int i = 0; i < 60; ++i) url += "\xEC\x8B\x9C";

    gradia::timetable::UrlValidator validator({"everytime.kr"});
    auto checked = validator.validate(url);
    REQUIRE_FALSE(checked.has_value());
    auto detail = std::string(checked.error().detail());
    CHECK(detail.size() <= 128);
    CHECK((detail.size() - 18) % 3 == 0);

    gradia::Result<std::vector<gradia::TimetableEntry>> result =
        std::unexpected(checked.error());
    auto j = gradia::cli::render_result(url, result);
    CHECK_NOTHROW(j.dump());
    CHECK(j["error"]["code"] == "VALIDATION_ERROR");
}
