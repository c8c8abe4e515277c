#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "chatbridge/core/config.hpp"
#include "chatbridge/core/error.hpp"

namespace chatbridge::cli {

/// State shared by the global options and every subcommand.
struct CommandContext {
    Config config = load_config_from_env();
    std::string config_path;
    std::optional<std::string> log_level;
    int exit_code = 0;

    /// Initialise logging and load the config file. Called by each
    /// subcommand before it does any work.
    void prepare();
};

/// Read a whole file, or stdin when `path` is "-".
auto read_input(const std::string& path) -> Result<std::string>;

/// Read and parse a JSON document from a file or stdin.
auto read_json_input(const std::string& path) -> Result<json>;

/// Print a mapped source-protocol error body to `out`. Returns exit code 1.
auto report_error(const Error& error, std::ostream& out) -> int;

/// `request <file>`: map a Chat Completions request to a Messages request.
void register_request_command(CLI::App& app, CommandContext& ctx);

/// `response <file> --model M`: map a Messages response.
void register_response_command(CLI::App& app, CommandContext& ctx);

/// `stream <file> --model M`: translate a captured Messages event stream.
void register_stream_command(CLI::App& app, CommandContext& ctx);

/// `error <file> --status N`: map a Messages error body.
void register_error_command(CLI::App& app, CommandContext& ctx);

/// `complete <file>`: send a Chat Completions request through the backend.
void register_complete_command(CLI::App& app, CommandContext& ctx);

/// `version`: print the build version.
void register_version_command(CLI::App& app);

} // namespace chatbridge::cli
