#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "gradia/core/config.hpp"

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = gradia::default_config();

    SECTION("scraper defaults") {
        CHECK(cfg.scraper.max_handles == 5);
        CHECK(cfg.scraper.admission_slots == 5);
        CHECK(cfg.scraper.worker_threads == 0);
        CHECK(cfg.scraper.navigation_timeout_ms == 10000);
        CHECK(cfg.scraper.settle_delay_ms == 2000);
        CHECK(cfg.scraper.max_retries == 2);
        CHECK(cfg.scraper.retry_backoff_ms == 1000);
        CHECK(cfg.scraper.pixels_per_hour == 60);
        REQUIRE(cfg.scraper.allowed_domains.size() == 1);
        CHECK(cfg.scraper.allowed_domains[0] == "everytime.kr");
    }

    SECTION("browser defaults") {
        CHECK(cfg.browser.headless);
        CHECK(cfg.browser.incognito);
        CHECK(cfg.browser.disable_extensions);
        CHECK(cfg.browser.viewport_width == 1920);
        CHECK(cfg.browser.viewport_height == 1080);
        CHECK_FALSE(cfg.browser.chrome_path.has_value());
    }

    SECTION("log level defaults") {
        CHECK(cfg.log_level == "info");
    }

    SECTION("defaults validate") {
        CHECK(gradia::validate_config(cfg).has_value());
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "gradia_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "scraper": {
                "max_handles": 8,
                "admission_slots": 4,
                "allowed_domains": ["everytime.kr", "example.edu"]
            },
            "browser": {
                "headless": false,
                "chrome_path": "/opt/chrome/chrome"
            },
            "log_level": "debug"
        })";
    }

    auto cfg = gradia::load_config(tmp);

    CHECK(cfg.scraper.max_handles == 8);
    CHECK(cfg.scraper.admission_slots == 4);
    CHECK(cfg.scraper.allowed_domains.size() == 2);
    CHECK(cfg.browser.headless == false);
    CHECK(cfg.browser.chrome_path.value() == "/opt/chrome/chrome");
    CHECK(cfg.log_level == "debug");
    // Non-specified fields keep defaults
    CHECK(cfg.scraper.max_retries == 2);
    CHECK(cfg.browser.viewport_width == 1920);

    fs::remove(tmp);
}

TEST_CASE("load_config returns defaults for missing or malformed file", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = gradia::load_config("/nonexistent/path/config.json");
        CHECK(cfg.scraper.max_handles == 5);
        CHECK(cfg.log_level == "info");
    }

    SECTION("malformed file") {
        auto tmp = fs::temp_directory_path() / "gradia_test_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = gradia::load_config(tmp);
        CHECK(cfg.scraper.max_handles == 5);
        fs::remove(tmp);
    }
}

TEST_CASE("apply_env_overrides reads GRADIA_ variables", "[config]") {
    ::setenv("GRADIA_MAX_HANDLES", "7", 1);
    ::setenv("GRADIA_ADMISSION_SLOTS", "3", 1);
    ::setenv("GRADIA_MAX_RETRIES", "0", 1);
    ::setenv("GRADIA_NAVIGATION_TIMEOUT_MS", "2500", 1);
    ::setenv("GRADIA_HEADLESS", "false", 1);
    ::setenv("GRADIA_CHROME_PATH", "/usr/bin/chromium", 1);
    ::setenv("GRADIA_LOG_LEVEL", "trace", 1);
    ::setenv("GRADIA_RETRY_BACKOFF_MS", "not-a-number", 1);

    auto cfg = gradia::load_config_from_env();

    CHECK(cfg.scraper.max_handles == 7);
    CHECK(cfg.scraper.admission_slots == 3);
    CHECK(cfg.scraper.max_retries == 0);
    CHECK(cfg.scraper.navigation_timeout_ms == 2500);
    CHECK(cfg.browser.headless == false);
    CHECK(cfg.browser.chrome_path.value() == "/usr/bin/chromium");
    CHECK(cfg.log_level == "trace");
    // Unparseable values are ignored
    CHECK(cfg.scraper.retry_backoff_ms == 1000);

    for (const char* name : {"GRADIA_MAX_HANDLES", "GRADIA_ADMISSION_SLOTS",
                             "GRADIA_MAX_RETRIES", "GRADIA_NAVIGATION_TIMEOUT_MS",
                             "GRADIA_HEADLESS", "GRADIA_CHROME_PATH",
                             "GRADIA_LOG_LEVEL", "GRADIA_RETRY_BACKOFF_MS"}) {
        ::unsetenv(name);
    }
}

TEST_CASE("validate_config enforces cross-field constraints", "[config]") {
    auto cfg = gradia::default_config();

    SECTION("admission gate larger than the pool") {
        cfg.scraper.admission_slots = 6;
        auto r = gradia::validate_config(cfg);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == gradia::ErrorCode::InvalidConfig);
    }

    SECTION("zero handles") {
        cfg.scraper.max_handles = 0;
        CHECK_FALSE(gradia::validate_config(cfg).has_value());
    }

    SECTION("worker pool smaller than the driver pool") {
        cfg.scraper.worker_threads = 2;
        CHECK_FALSE(gradia::validate_config(cfg).has_value());
    }

    SECTION("negative retries") {
        cfg.scraper.max_retries = -1;
        CHECK_FALSE(gradia::validate_config(cfg).has_value());
    }

    SECTION("no allowed domains") {
        cfg.scraper.allowed_domains.clear();
        CHECK_FALSE(gradia::validate_config(cfg).has_value());
    }

    SECTION("unknown log level") {
        cfg.log_level = "verbose";
        auto r = gradia::validate_config(cfg);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().detail() == "verbose");
    }

    SECTION("smaller gate is fine") {
        cfg.scraper.admission_slots = 2;
        cfg.scraper.worker_threads = 10;
        CHECK(gradia::validate_config(cfg).has_value());
        CHECK(gradia::effective_worker_threads(cfg.scraper) == 10);
    }
}

TEST_CASE("effective_worker_threads defaults to the pool size", "[config]") {
    gradia::ScraperConfig sc;
    sc.max_handles = 4;
    CHECK(gradia::effective_worker_threads(sc) == 4);
}

TEST_CASE("Config round-trips through JSON", "[config]") {
    gradia::Config cfg;
    cfg.scraper.max_handles = 3;
    cfg.scraper.admission_slots = 2;
    cfg.log_level = "warn";

    gradia::json j = cfg;
    auto restored = j.get<gradia::Config>();

    CHECK(restored.scraper.max_handles == 3);
    CHECK(restored.scraper.admission_slots == 2);
    CHECK(restored.log_level == "warn");
    CHECK(restored.browser.user_agent == gradia::kDefaultUserAgent);
}
