#include "gradia/cli/app.hpp"
#include "gradia/cli/commands.hpp"
#include "gradia/core/logger.hpp"

#ifndef GRADIA_VERSION_STRING
#define GRADIA_VERSION_STRING "0.1.0-dev"
#endif

namespace gradia::cli {

App::App()
    : cli_("gradia-timetable", "Headless-browser timetable scraper")
{
    cli_.set_version_flag("--version", GRADIA_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("GRADIA_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    Logger::flush();
    return context_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return context_.config;
}

void App::setup_commands() {
    register_parse_command(cli_, context_);
    register_config_command(cli_, context_);
    register_version_command(cli_);
}

} // namespace gradia::cli
