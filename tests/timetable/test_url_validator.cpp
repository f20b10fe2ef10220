#include <catch2/catch_test_macros.hpp>

#include <string>

#include "gradia/timetable/url_validator.hpp"

using gradia::ErrorCode;
using gradia::timetable::UrlValidator;

TEST_CASE("UrlValidator accepts timetable URLs on allowed domains", "[validator]") {
    UrlValidator validator({"everytime.kr"});

    for (const char* url : {
             "https://everytime.kr/@AbCdEf123",
             "http://everytime.kr/@AbCdEf123",
             "HTTPS://EVERYTIME.KR/@x",
             "https://www.everytime.kr/timetable?id=1#top",
             "https://everytime.kr:443/@x",
             "https://everytime.kr./@x",
             "https://everytime.kr",
         }) {
        INFO(url);
        CHECK(validator.validate(url).has_value());
    }
}

TEST_CASE("UrlValidator rejects malformed or off-domain URLs", "[validator]") {
    UrlValidator validator({"everytime.kr"});

    for (const char* url : {
             "",
             "ftp://example.com",
             "https://unrelated-domain.example",
             "everytime.kr/@x",
             "https://",
             "https://noteverytime.kr/@x",
             "https://everytime.kr.evil.com/@x",
             "https://evil.com/?next=everytime.kr",
             "https://everytime.kr@evil.com/",
             "https://every time.kr/",
             "javascript:alert(1)//everytime.kr",
         }) {
        INFO(url);
        auto r = validator.validate(url);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ValidationError);
    }

    SECTION("overlong URLs") {
        std::string url = "https://everytime.kr/" + std::string(UrlValidator::kMaxUrlLength, 'a');
        CHECK_FALSE(validator.validate(url).has_value());
    }
}

TEST_CASE("UrlValidator::extract_host strips userinfo, port and case", "[validator]") {
    CHECK(UrlValidator::extract_host("https://User:pw@Sub.EveryTime.kr:8443/path?q#f") ==
          "sub.everytime.kr");
    CHECK(UrlValidator::extract_host("http://everytime.kr.") == "everytime.kr");
    CHECK(UrlValidator::extract_host("https://[::1]:8080/") == "::1");
    CHECK(UrlValidator::extract_host("no-scheme.example").empty());
}

TEST_CASE("UrlValidator normalizes configured domains", "[validator]") {
    UrlValidator validator({" EveryTime.KR. ", "", "example.edu"});
    REQUIRE(validator.allowed_domains().size() == 2);
    CHECK(validator.allowed_domains()[0] == "everytime.kr");
    CHECK(validator.validate("https://timetable.example.edu/").has_value());
}
