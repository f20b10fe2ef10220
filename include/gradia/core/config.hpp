#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gradia/core/error.hpp"
#include "gradia/core/types.hpp"

// std::optional serializer for nlohmann/json, used by the NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace gradia {

inline constexpr const char* kDefaultUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/135.0.0.0 Safari/537.36";

/// Options applied to every browser instance the pool creates.
struct BrowserConfig {
    bool headless = true;
    std::optional<std::string> chrome_path;
    int viewport_width = 1920;
    int viewport_height = 1080;
    std::string user_agent = kDefaultUserAgent;
    bool incognito = true;
    bool disable_extensions = true;
    int launch_timeout_ms = 10000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BrowserConfig, headless, chrome_path, viewport_width, viewport_height, user_agent, incognito, disable_extensions, launch_timeout_ms)

struct ScraperConfig {
    size_t max_handles = 5;
    size_t admission_slots = 5;
    size_t worker_threads = 0;  // 0 = max_handles
    int navigation_timeout_ms = 10000;
    int settle_delay_ms = 2000;
    int max_retries = 2;
    int retry_backoff_ms = 1000;
    int pixels_per_hour = 60;
    std::vector<std::string> allowed_domains = {"everytime.kr"};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ScraperConfig, max_handles, admission_slots, worker_threads, navigation_timeout_ms, settle_delay_ms, max_retries, retry_backoff_ms, pixels_per_hour, allowed_domains)

struct Config {
    BrowserConfig browser;
    ScraperConfig scraper;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, browser, scraper, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Overlays GRADIA_* environment variables onto an existing configuration.
void apply_env_overrides(Config& config);

/// Checks the cross-field constraints between pool, gate and worker sizes.
auto validate_config(const Config& config) -> VoidResult;

/// Worker pool size after resolving the "0 = max_handles" default.
[[nodiscard]] auto effective_worker_threads(const ScraperConfig& config) -> size_t;

} // namespace gradia
