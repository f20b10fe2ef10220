#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include "gradia/core/types.hpp"
#include "gradia/core/utils.hpp"

TEST_CASE("generate_id produces expected length", "[utils]") {
    SECTION("default length") {
        REQUIRE(gradia::utils::generate_id().size() == 16);
    }

    SECTION("contains only lowercase alphanumeric characters") {
        auto id = gradia::utils::generate_id(100);
        for (char c : id) {
            bool valid = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
            CHECK(valid);
        }
    }

    SECTION("successive calls produce different IDs") {
        CHECK(gradia::utils::generate_id(16) != gradia::utils::generate_id(16));
    }
}

TEST_CASE("trim and split", "[utils]") {
    CHECK(gradia::utils::trim("  hello  ") == "hello");
    CHECK(gradia::utils::trim("\t\n") == "");

    auto parts = gradia::utils::split("complete|https://everytime.kr/@x", '|');
    REQUIRE(parts.size() == 2);
    CHECK(parts[0] == "complete");
    CHECK(parts[1] == "https://everytime.kr/@x");
}

TEST_CASE("truncate_utf8 never splits a multi-byte sequence", "[utils]") {
    // "\xEC\x8B\x9C\xEA\xB0\x84" is two 3-byte Hangul syllables.
    const std::string text = "ab\xEC\x8B\x9C\xEA\xB0\x84";
    CHECK(gradia::utils::truncate_utf8(text, 100) == text);
    CHECK(gradia::utils::truncate_utf8(text, 5) == "ab\xEC\x8B\x9C");
    CHECK(gradia::utils::truncate_utf8(text, 4) == "ab");
    CHECK(gradia::utils::truncate_utf8(text, 3) == "ab");
    CHECK(gradia::utils::truncate_utf8(text, 2) == "ab");
    CHECK(gradia::utils::truncate_utf8(text, 0) == "");
}

TEST_CASE("parse_int accepts whole integers only", "[utils]") {
    CHECK(gradia::utils::parse_int("42") == 42);
    CHECK(gradia::utils::parse_int(" +7 ") == 7);
    CHECK(gradia::utils::parse_int("-3") == -3);
    CHECK_FALSE(gradia::utils::parse_int("12ms").has_value());
    CHECK_FALSE(gradia::utils::parse_int("").has_value());
    CHECK_FALSE(gradia::utils::parse_int("99999999999").has_value());
}

TEST_CASE("env_bool understands common spellings", "[utils]") {
    ::setenv("GRADIA_TEST_FLAG", "Yes", 1);
    CHECK(gradia::utils::env_bool("GRADIA_TEST_FLAG") == true);
    ::setenv("GRADIA_TEST_FLAG", "off", 1);
    CHECK(gradia::utils::env_bool("GRADIA_TEST_FLAG") == false);
    ::setenv("GRADIA_TEST_FLAG", "maybe", 1);
    CHECK_FALSE(gradia::utils::env_bool("GRADIA_TEST_FLAG").has_value());
    ::unsetenv("GRADIA_TEST_FLAG");
    CHECK_FALSE(gradia::utils::env_bool("GRADIA_TEST_FLAG").has_value());
}

TEST_CASE("Weekday mapping and TimetableEntry JSON", "[types]") {
    CHECK(gradia::weekday_from_index(0) == gradia::Weekday::Monday);
    CHECK(gradia::weekday_from_index(4) == gradia::Weekday::Friday);
    CHECK_FALSE(gradia::weekday_from_index(5).has_value());
    CHECK(gradia::weekday_name(gradia::Weekday::Wednesday) == "Wednesday");

    gradia::TimetableEntry entry{gradia::Weekday::Tuesday, "Compilers", "09:00",
                                 "10:30", "Eng-101", "Lee"};
    gradia::json j = entry;
    CHECK(j["day"] == "Tuesday");
    CHECK(j["startTime"] == "09:00");
    CHECK(j["endTime"] == "10:30");
    CHECK(j["instructor"] == "Lee");
    CHECK(j.get<gradia::TimetableEntry>() == entry);
}
