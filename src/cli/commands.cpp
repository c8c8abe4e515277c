#include "chatbridge/cli/commands.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include "chatbridge/backend/messages_client.hpp"
#include "chatbridge/core/logger.hpp"
#include "chatbridge/stream/sse.hpp"
#include "chatbridge/stream/stream_writer.hpp"
#include "chatbridge/translate/error_mapper.hpp"
#include "chatbridge/translate/request_mapper.hpp"
#include "chatbridge/translate/response_mapper.hpp"
#include "chatbridge/translate/stream_translator.hpp"

#ifndef CHATBRIDGE_VERSION_STRING
#define CHATBRIDGE_VERSION_STRING "0.1.0-dev"
#endif

namespace chatbridge::cli {

namespace {

void print_json(const json& j) {
    std::cout << j.dump(2) << "\n";
    std::cout.flush();
}

auto string_member(const json& obj, const char* key) -> std::string {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

/// Model name for a captured stream: the `message_start` model, if any.
auto model_from_events(const std::vector<json>& events) -> std::string {
    for (const auto& event : events) {
        if (string_member(event, "type") == "message_start" && event.contains("message")) {
            return string_member(event["message"], "model");
        }
    }
    return {};
}

auto run_stream_capture(CommandContext& ctx, const std::string& input,
                        std::string model, bool include_thinking) -> int {
    auto text = read_input(input);
    if (!text) return report_error(text.error(), std::cout);

    auto events = stream::SseDecoder::decode_all(*text);
    LOG_INFO("Decoded {} stream events from {}", events.size(), input);

    if (model.empty()) model = model_from_events(events);
    if (model.empty()) model = ctx.config.default_model.value_or("");

    auto stream_ctx = translate::make_stream_context(std::move(model), include_thinking);

    boost::asio::io_context ioc;
    stream::VectorEventSource source(std::move(events));
    stream::OstreamSink sink(std::cout);
    std::optional<VoidResult> outcome;

    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            outcome = co_await stream::write_source_stream(source, sink, stream_ctx);
        },
        boost::asio::detached);
    ioc.run();

    if (!outcome || !*outcome) {
        LOG_ERROR("Stream translation failed: {}",
                  outcome ? outcome->error().what() : std::string("not completed"));
        return 1;
    }
    return 0;
}

auto run_complete(CommandContext& ctx, const std::string& input, bool include_thinking) -> int {
    auto source_request = read_json_input(input);
    if (!source_request) return report_error(source_request.error(), std::cout);

    auto mapped = translate::map_request(*source_request, mapper_options(ctx.config));
    if (!mapped) return report_error(mapped.error(), std::cout);

    auto model = string_member(mapped->body, "model");
    bool streaming = mapped->body.value("stream", false);

    boost::asio::io_context ioc;
    backend::MessagesClient client(ioc, ctx.config.backend);
    int exit_code = 0;

    if (!streaming) {
        boost::asio::co_spawn(ioc,
            [&]() -> boost::asio::awaitable<void> {
                auto reply = co_await client.complete(mapped->body);
                if (!reply) {
                    exit_code = report_error(reply.error(), std::cout);
                } else if (!reply->is_success()) {
                    print_json(translate::map_error(reply->body, reply->status));
                    exit_code = 1;
                } else {
                    print_json(translate::map_response(
                        reply->body, model, {.include_thinking = include_thinking}));
                }
            },
            boost::asio::detached);
        ioc.run();
        return exit_code;
    }

    stream::QueuedEventSource source(ioc.get_executor());
    stream::OstreamSink sink(std::cout);
    auto stream_ctx = translate::make_stream_context(model, include_thinking);
    std::optional<json> upstream_error;

    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            auto reply = co_await client.stream(mapped->body, [&source](json event) {
                source.push(std::move(event));
                return true;
            });
            if (!reply) {
                source.fail(reply.error());
            } else if (!reply->is_success()) {
                upstream_error = translate::map_error(reply->body, reply->status);
                source.fail(make_error(ErrorCode::UpstreamError,
                                       "Messages API returned HTTP " +
                                           std::to_string(reply->status)));
            } else {
                source.close();
            }
        },
        boost::asio::detached);

    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            auto written = co_await stream::write_source_stream(source, sink, stream_ctx);
            if (!written) {
                if (upstream_error) {
                    print_json(*upstream_error);
                } else {
                    LOG_ERROR("Stream ended abruptly: {}", written.error().what());
                }
                exit_code = 1;
            }
        },
        boost::asio::detached);

    ioc.run();
    return exit_code;
}

} // anonymous namespace

void CommandContext::prepare() {
    Logger::init("chatbridge", log_level.value_or(config.log_level));

    if (!config_path.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path);
        config = load_config(std::filesystem::path(config_path));
        if (!log_level) {
            Logger::set_level(config.log_level);
        }
    }
}

auto read_input(const std::string& path) -> Result<std::string> {
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return ss.str();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot open input", path));
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

auto read_json_input(const std::string& path) -> Result<json> {
    auto text = read_input(path);
    if (!text) return std::unexpected(text.error());

    try {
        return json::parse(*text);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(
            ErrorCode::MalformedRequest, "Input is not valid JSON", e.what()));
    }
}

auto report_error(const Error& error, std::ostream& out) -> int {
    LOG_ERROR("{} ({})", error.what(), error_code_to_string(error.code()));
    auto mapped = translate::map_local_error(error);
    out << mapped.body.dump(2) << "\n";
    return 1;
}

// ---------------------------------------------------------------------------
// request command
// ---------------------------------------------------------------------------

void register_request_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("request",
        "Map a Chat Completions request to a Messages API request");

    static std::string input = "-";
    sub->add_option("input", input, "Request JSON file ('-' for stdin)");

    sub->callback([&ctx]() {
        ctx.prepare();

        auto source = read_json_input(input);
        if (!source) {
            ctx.exit_code = report_error(source.error(), std::cout);
            return;
        }

        auto mapped = translate::map_request(*source, mapper_options(ctx.config));
        if (!mapped) {
            ctx.exit_code = report_error(mapped.error(), std::cout);
            return;
        }

        if (!mapped->ignored_fields.empty()) {
            LOG_INFO("Request mapped with {} ignored field(s)", mapped->ignored_fields.size());
        }
        print_json(mapped->body);
    });
}

// ---------------------------------------------------------------------------
// response command
// ---------------------------------------------------------------------------

void register_response_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("response",
        "Map a Messages API response to a Chat Completions response");

    static std::string input = "-";
    static std::string model;
    static bool thinking = false;
    static int status = 200;
    sub->add_option("input", input, "Response JSON file ('-' for stdin)");
    sub->add_option("-m,--model", model, "Model name to report (default: the response's model)");
    sub->add_flag("--thinking", thinking, "Render thinking blocks as <thinking> text");
    sub->add_option("-s,--status", status, "HTTP status the response arrived with");

    sub->callback([&ctx]() {
        ctx.prepare();

        auto target = read_json_input(input);
        if (!target) {
            ctx.exit_code = report_error(target.error(), std::cout);
            return;
        }

        bool is_error = (status < 200 || status >= 300) ||
                        string_member(*target, "type") == "error";
        if (is_error) {
            print_json(translate::map_error(*target, status));
            ctx.exit_code = 1;
            return;
        }

        auto reported = model.empty() ? string_member(*target, "model") : model;
        print_json(translate::map_response(
            *target, reported, {.include_thinking = thinking || ctx.config.include_thinking}));
    });
}

// ---------------------------------------------------------------------------
// stream command
// ---------------------------------------------------------------------------

void register_stream_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("stream",
        "Translate a captured Messages API event stream to Chat Completions SSE");

    static std::string input = "-";
    static std::string model;
    static bool thinking = false;
    sub->add_option("input", input, "SSE capture file ('-' for stdin)");
    sub->add_option("-m,--model", model, "Model name to report (default: from message_start)");
    sub->add_flag("--thinking", thinking, "Render thinking blocks as <thinking> text");

    sub->callback([&ctx]() {
        ctx.prepare();
        ctx.exit_code = run_stream_capture(ctx, input, model,
                                           thinking || ctx.config.include_thinking);
    });
}

// ---------------------------------------------------------------------------
// error command
// ---------------------------------------------------------------------------

void register_error_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("error",
        "Map a Messages API error body to a Chat Completions error");

    static std::string input = "-";
    static int status = 500;
    sub->add_option("input", input, "Error JSON file ('-' for stdin)");
    sub->add_option("-s,--status", status, "HTTP status of the error response");

    sub->callback([&ctx]() {
        ctx.prepare();

        auto target = read_json_input(input);
        if (!target) {
            ctx.exit_code = report_error(target.error(), std::cout);
            return;
        }
        print_json(translate::map_error(*target, status));
    });
}

// ---------------------------------------------------------------------------
// complete command
// ---------------------------------------------------------------------------

void register_complete_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("complete",
        "Send a Chat Completions request through the Messages API backend");

    static std::string input = "-";
    static bool thinking = false;
    sub->add_option("input", input, "Request JSON file ('-' for stdin)");
    sub->add_flag("--thinking", thinking, "Render thinking blocks as <thinking> text");

    sub->callback([&ctx]() {
        ctx.prepare();
        ctx.exit_code = run_complete(ctx, input, thinking || ctx.config.include_thinking);
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "chatbridge " << CHATBRIDGE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#endif
    });
}

} // namespace chatbridge::cli
