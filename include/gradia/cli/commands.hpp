#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "gradia/core/config.hpp"
#include "gradia/core/error.hpp"
#include "gradia/core/types.hpp"

namespace gradia::cli {

/// State shared between the global options and the subcommands.
struct CommandContext {
    Config config;
    std::string config_path;
    std::string log_level;
    int exit_code = 0;

    /// Load the config file (if any), overlay GRADIA_* variables and the
    /// global --log-level, then start logging.
    void resolve();
};

/// Register the `parse` subcommand.
/// Scrapes every given URL concurrently and prints one JSON result per URL.
void register_parse_command(CLI::App& app, CommandContext& context);

/// Register the `config` subcommand.
/// Prints and validates the effective configuration.
void register_config_command(CLI::App& app, CommandContext& context);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

/// JSON document printed for one parsed URL.
auto render_result(std::string_view url, const Result<std::vector<TimetableEntry>>& result)
    -> nlohmann::json;

/// One scrape, as run by parse_all().
using ParseFn = std::function<boost::asio::awaitable<Result<std::vector<TimetableEntry>>>(
    std::string url)>;

struct ParseOutcome {
    std::vector<nlohmann::json> documents;  // one per URL, in input order
    size_t failures = 0;
};

/// Spawn one parse per URL on `ioc` and run it until every task has
/// finished. `on_done` fires once after the last task, whether it returned
/// or threw; a thrown task is rendered as an INTERNAL_ERROR document.
auto parse_all(boost::asio::io_context& ioc, const std::vector<std::string>& urls,
               const ParseFn& parse, std::function<void()> on_done) -> ParseOutcome;

} // namespace gradia::cli
