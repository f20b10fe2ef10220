#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include "gradia/core/logger.hpp"

using gradia::Logger;

TEST_CASE("Logger::parse_level knows the spdlog level names", "[logger]") {
    CHECK(Logger::parse_level("trace") == spdlog::level::trace);
    CHECK(Logger::parse_level("warn") == spdlog::level::warn);
    CHECK(Logger::parse_level("error") == spdlog::level::err);
    CHECK(Logger::parse_level("off") == spdlog::level::off);
    CHECK_FALSE(Logger::parse_level("verbose").has_value());
    CHECK_FALSE(Logger::parse_level("INFO").has_value());
    CHECK_FALSE(Logger::parse_level("").has_value());
}

TEST_CASE("Logger::set_level ignores unknown names", "[logger]") {
    Logger::init("gradia", "debug");
    CHECK(Logger::get()->level() == spdlog::level::debug);

    CHECK_FALSE(Logger::set_level("loud"));
    CHECK(Logger::get()->level() == spdlog::level::debug);

    CHECK(Logger::set_level("error"));
    CHECK(Logger::get()->level() == spdlog::level::err);

    SECTION("init with an unknown level falls back to info") {
        Logger::init("gradia", "loud");
        CHECK(Logger::get()->level() == spdlog::level::info);
    }
}

TEST_CASE("Logger can be re-initialised while other threads log", "[logger][concurrency]") {
    Logger::init("gradia", "off");
    std::atomic<bool> stop{false};
    std::vector<std::thread> writers;
    for (int i = 0; i < 4; ++i) {
        writers.emplace_back([&stop] {
            while (!stop) {
                LOG_INFO("background message");
            }
        });
    }
    for (int i = 0; i < 20; ++i) {
        Logger::init("gradia", "off");
    }
    stop = true;
    for (auto& t : writers) t.join();

    CHECK(Logger::get()->name() == "gradia");
    Logger::init("gradia", "info");
}
