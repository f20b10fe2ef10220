#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gradia {

/// Process-wide stderr logger. stdout is reserved for CLI results.
class Logger {
public:
    /// (Re)create the logger. Safe while worker threads are logging; they
    /// keep the previous instance until their current call returns.
    static void init(std::string_view name = "gradia", std::string_view level = "info");

    /// Current logger, created with defaults on first use.
    static auto get() -> std::shared_ptr<spdlog::logger>;

    /// Unknown names leave the level unchanged and return false.
    static auto set_level(std::string_view level) -> bool;
    static void flush();

    /// "trace", "debug", "info", "warn", "error", "critical" or "off".
    [[nodiscard]] static auto parse_level(std::string_view level)
        -> std::optional<spdlog::level::level_enum>;
};

} // namespace gradia

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::gradia::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::gradia::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::gradia::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::gradia::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::gradia::Logger::get(), __VA_ARGS__)
