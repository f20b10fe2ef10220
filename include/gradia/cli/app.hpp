#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "gradia/cli/commands.hpp"
#include "gradia/core/config.hpp"

namespace gradia::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (parse, config, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    CLI::App cli_;
    CommandContext context_;
};

} // namespace gradia::cli
