#include "chatbridge/cli/app.hpp"

#include "chatbridge/core/logger.hpp"

#ifndef CHATBRIDGE_VERSION_STRING
#define CHATBRIDGE_VERSION_STRING "0.1.0-dev"
#endif

namespace chatbridge::cli {

App::App()
    : cli_("chatbridge", "Chat Completions <-> Messages API translator")
{
    cli_.set_version_flag("--version", CHATBRIDGE_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", ctx_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("CHATBRIDGE_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", ctx_.log_level,
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

    // Subcommand callbacks ran inside parse() and recorded their result.
    Logger::flush();
    return ctx_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::context() -> CommandContext& {
    return ctx_;
}

void App::setup_commands() {
    register_request_command(cli_, ctx_);
    register_response_command(cli_, ctx_);
    register_stream_command(cli_, ctx_);
    register_error_command(cli_, ctx_);
    register_complete_command(cli_, ctx_);
    register_version_command(cli_);
}

} // namespace chatbridge::cli
