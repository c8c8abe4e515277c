#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "chatbridge/cli/commands.hpp"

namespace chatbridge::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// translation subcommands (request, response, stream, error, complete,
/// version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto context() -> CommandContext&;

private:
    void setup_commands();

    CLI::App cli_;
    CommandContext ctx_;
};

} // namespace chatbridge::cli
