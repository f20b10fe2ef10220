#include "gradia/core/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gradia {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

auto make_logger(std::string_view name) -> std::shared_ptr<spdlog::logger> {
    // Re-initialising under the same name must not trip spdlog's registry.
    spdlog::drop(std::string(name));
    auto logger = spdlog::stderr_color_mt(std::string(name));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v");
    return logger;
}

} // anonymous namespace

auto Logger::parse_level(std::string_view level)
    -> std::optional<spdlog::level::level_enum> {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

void Logger::init(std::string_view name, std::string_view level) {
    std::shared_ptr<spdlog::logger> logger;
    {
        // spdlog's registry is keyed by name, so creation is serialized too.
        std::lock_guard lock(g_logger_mutex);
        logger = make_logger(name);
        logger->set_level(parse_level(level).value_or(spdlog::level::info));
        g_logger = logger;
    }
    if (!parse_level(level)) {
        logger->warn("Unknown log level '{}', using info", level);
    }
}

auto Logger::get() -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(g_logger_mutex);
    // Worker threads may log before anyone called init().
    if (!g_logger) {
        g_logger = make_logger("gradia");
        g_logger->set_level(spdlog::level::info);
    }
    return g_logger;
}

auto Logger::set_level(std::string_view level) -> bool {
    auto parsed = parse_level(level);
    if (!parsed) return false;
    get()->set_level(*parsed);
    return true;
}

void Logger::flush() {
    get()->flush();
}

} // namespace gradia
