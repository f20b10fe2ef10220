#include "gradia/cli/commands.hpp"
#include "gradia/browser/chrome_engine.hpp"
#include "gradia/core/logger.hpp"
#include "gradia/timetable/service.hpp"

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#ifndef GRADIA_VERSION_STRING
#define GRADIA_VERSION_STRING "0.1.0-dev"
#endif

namespace gradia::cli {

using json = nlohmann::json;

void CommandContext::resolve() {
    if (!config_path.empty()) {
        config = load_config(std::filesystem::path(config_path));
    }
    apply_env_overrides(config);
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
    Logger::init("gradia", config.log_level);
    if (!config_path.empty()) {
        LOG_DEBUG("Loaded configuration from: {}", config_path);
    }
}

auto render_result(std::string_view url, const Result<std::vector<TimetableEntry>>& result)
    -> json {
    if (result) {
        return json{
            {"url", url},
            {"timetable", *result},
            {"message", "Timetable parsed successfully"},
        };
    }
    const auto& error = result.error();
    return json{
        {"url", url},
        {"error", {
            {"code", error_code_to_string(error.code())},
            {"kind", failure_kind_to_string(failure_kind(error.code()))},
            {"message", error.message()},
            {"detail", error.detail()},
            {"status", http_status_for(error.code())},
        }},
    };
}

auto parse_all(boost::asio::io_context& ioc, const std::vector<std::string>& urls,
               const ParseFn& parse, std::function<void()> on_done) -> ParseOutcome {
    ParseOutcome outcome;
    outcome.documents.resize(urls.size());
    size_t remaining = urls.size();

    auto finish_one = [&] {
        if (--remaining == 0 && on_done) {
            on_done();
        }
    };

    for (size_t i = 0; i < urls.size(); ++i) {
        boost::asio::co_spawn(
            ioc,
            [&, i]() -> boost::asio::awaitable<void> {
                auto result = co_await parse(urls[i]);
                if (!result) ++outcome.failures;
                outcome.documents[i] = render_result(urls[i], result);
            },
            [&, i](std::exception_ptr e) {
                if (e) {
                    ++outcome.failures;
                    std::string what = "unknown exception";
                    try {
                        std::rethrow_exception(e);
                    } catch (const std::exception& ex) {
                        what = ex.what();
                    }
                    LOG_ERROR("Parse task for {} failed: {}", urls[i], what);
                    outcome.documents[i] = render_result(
                        urls[i], std::unexpected(make_error(ErrorCode::InternalError,
                                                            "Parse task failed", what)));
                }
                finish_one();
            });
    }

    if (urls.empty() && on_done) {
        on_done();
    }
    ioc.run();
    return outcome;
}

// ---------------------------------------------------------------------------
// parse command
// ---------------------------------------------------------------------------

namespace {

struct ParseOptions {
    std::vector<std::string> urls;
    std::optional<size_t> max_handles;
    std::optional<size_t> admission_slots;
    std::optional<int> max_retries;
    std::optional<int> navigation_timeout_ms;
    bool headed = false;
    bool compact = false;
};

auto run_parse(CommandContext& context, const ParseOptions& options) -> int {
    auto& config = context.config;
    if (options.max_handles) config.scraper.max_handles = *options.max_handles;
    if (options.admission_slots) config.scraper.admission_slots = *options.admission_slots;
    if (options.max_retries) config.scraper.max_retries = *options.max_retries;
    if (options.navigation_timeout_ms) {
        config.scraper.navigation_timeout_ms = *options.navigation_timeout_ms;
    }
    if (options.headed) config.browser.headless = false;

    boost::asio::io_context ioc;
    auto service = timetable::TimetableService::create(
        ioc.get_executor(), config, std::make_shared<browser::ChromeEngine>());
    if (!service) {
        LOG_ERROR("Cannot start scraper: {}", service.error().what());
        return 2;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&service](const boost::system::error_code& ec, int sig) {
        if (!ec) {
            LOG_WARN("Received signal {}, closing every browser", sig);
            (*service)->shutdown();
        }
    });

    auto outcome = parse_all(
        ioc, options.urls,
        [&service](std::string url) { return (*service)->parse_timetable(std::move(url)); },
        [&signals] { signals.cancel(); });

    for (const auto& document : outcome.documents) {
        // Page text is not guaranteed to be valid UTF-8.
        std::cout << document.dump(options.compact ? -1 : 2, ' ', false,
                                   json::error_handler_t::replace)
                  << "\n";
    }
    std::cout.flush();

    return outcome.failures == 0 ? 0 : 1;
}

} // anonymous namespace

void register_parse_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("parse", "Scrape one or more timetable URLs");

    auto options = std::make_shared<ParseOptions>();
    sub->add_option("urls", options->urls, "Timetable URLs")->required();
    sub->add_option("--max-handles", options->max_handles,
                    "Maximum concurrent browser instances");
    sub->add_option("--admission-slots", options->admission_slots,
                    "Maximum concurrent scrape jobs");
    sub->add_option("--max-retries", options->max_retries,
                    "Retries after the first attempt");
    sub->add_option("--navigation-timeout-ms", options->navigation_timeout_ms,
                    "Per-attempt navigation timeout");
    sub->add_flag("--headed", options->headed, "Show the browser window");
    sub->add_flag("--compact", options->compact, "Print single-line JSON");

    sub->callback([&context, options]() {
        context.resolve();
        context.exit_code = run_parse(context, *options);
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&context, validate_only]() {
        context.resolve();

        auto valid = validate_config(context.config);
        if (!valid) {
            std::cerr << "Invalid configuration: " << valid.error().what() << "\n";
            context.exit_code = 1;
            return;
        }

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = context.config;
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "gradia-timetable " << GRADIA_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace gradia::cli
