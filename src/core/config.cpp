#include "gradia/core/config.hpp"
#include "gradia/core/logger.hpp"
#include "gradia/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace gradia {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

void apply_env_overrides(Config& config) {
    if (auto val = utils::env_int("GRADIA_MAX_HANDLES")) {
        config.scraper.max_handles = static_cast<size_t>(*val);
    }
    if (auto val = utils::env_int("GRADIA_ADMISSION_SLOTS")) {
        config.scraper.admission_slots = static_cast<size_t>(*val);
    }
    if (auto val = utils::env_int("GRADIA_WORKER_THREADS")) {
        config.scraper.worker_threads = static_cast<size_t>(*val);
    }
    if (auto val = utils::env_int("GRADIA_NAVIGATION_TIMEOUT_MS")) {
        config.scraper.navigation_timeout_ms = *val;
    }
    if (auto val = utils::env_int("GRADIA_SETTLE_DELAY_MS")) {
        config.scraper.settle_delay_ms = *val;
    }
    if (auto val = utils::env_int("GRADIA_MAX_RETRIES")) {
        config.scraper.max_retries = *val;
    }
    if (auto val = utils::env_int("GRADIA_RETRY_BACKOFF_MS")) {
        config.scraper.retry_backoff_ms = *val;
    }
    if (auto val = utils::env_bool("GRADIA_HEADLESS")) {
        config.browser.headless = *val;
    }
    if (auto* val = std::getenv("GRADIA_CHROME_PATH")) {
        config.browser.chrome_path = val;
    }
    if (auto* val = std::getenv("GRADIA_LOG_LEVEL")) {
        config.log_level = val;
    }
}

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const Config& config) -> VoidResult {
    const auto& s = config.scraper;

    if (s.max_handles < 1) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "scraper.max_handles must be at least 1"));
    }
    if (s.admission_slots < 1 || s.admission_slots > s.max_handles) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "scraper.admission_slots must be between 1 and max_handles",
            "admission_slots=" + std::to_string(s.admission_slots) +
            " max_handles=" + std::to_string(s.max_handles)));
    }
    if (s.worker_threads != 0 && s.worker_threads < s.max_handles) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "scraper.worker_threads must be 0 or at least max_handles",
            "worker_threads=" + std::to_string(s.worker_threads)));
    }
    if (s.navigation_timeout_ms <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "scraper.navigation_timeout_ms must be positive"));
    }
    if (s.settle_delay_ms < 0 || s.retry_backoff_ms < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "scraper delays must not be negative"));
    }
    if (s.max_retries < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "scraper.max_retries must not be negative"));
    }
    if (s.pixels_per_hour <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "scraper.pixels_per_hour must be positive"));
    }
    if (s.allowed_domains.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "scraper.allowed_domains must name at least one domain"));
    }
    if (!Logger::parse_level(config.log_level)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "log_level must be trace, debug, info, warn, error, critical or off",
            config.log_level));
    }
    if (config.browser.viewport_width <= 0 || config.browser.viewport_height <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "browser viewport must be positive"));
    }
    return {};
}

auto effective_worker_threads(const ScraperConfig& config) -> size_t {
    return config.worker_threads == 0 ? config.max_handles : config.worker_threads;
}

} // namespace gradia
