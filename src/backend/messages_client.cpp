#include "chatbridge/backend/messages_client.hpp"

#include <memory>

#include "chatbridge/core/logger.hpp"
#include "chatbridge/stream/sse.hpp"

namespace chatbridge::backend {

namespace {

constexpr auto kMessagesPath = "/v1/messages";

auto client_config(const BackendConfig& config) -> infra::HttpClientConfig {
    return infra::HttpClientConfig{
        .base_url = config.base_url,
        .timeout_seconds = config.timeout_seconds,
        .verify_ssl = config.verify_ssl,
        .default_headers = {
            {"x-api-key", config.api_key},
            {"anthropic-version", config.api_version},
            {"content-type", "application/json"},
        },
    };
}

auto model_name(const json& body) -> std::string {
    if (body.contains("model") && body["model"].is_string()) {
        return body["model"].get<std::string>();
    }
    return {};
}

} // anonymous namespace

auto parse_reply_body(int status, const std::string& body) -> json {
    auto parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded()) return parsed;

    LOG_WARN("Backend returned a non-JSON body (HTTP {})", status);
    return {
        {"type", "error"},
        {"error", {
            {"type", "api_error"},
            {"message", body.empty() ? "HTTP " + std::to_string(status) : body},
        }},
    };
}

MessagesClient::MessagesClient(boost::asio::io_context& ioc, const BackendConfig& config)
    : MessagesClient(std::make_unique<infra::HttpClient>(ioc, client_config(config)), config)
{
}

MessagesClient::MessagesClient(std::unique_ptr<infra::HttpTransport> transport,
                               const BackendConfig& config)
    : http_(std::move(transport))
{
    if (config.api_key.empty()) {
        LOG_WARN("Messages client has no API key configured");
    }
    LOG_INFO("Messages client initialized (base: {})", config.base_url);
}

MessagesClient::~MessagesClient() = default;

auto MessagesClient::complete(const json& request) -> awaitable<Result<BackendReply>> {
    auto body = request;
    body["stream"] = false;

    LOG_DEBUG("Messages request: model={}", model_name(body));

    auto result = co_await http_->post(kMessagesPath, body.dump(), "application/json", {});
    if (!result) {
        co_return make_fail(make_error(ErrorCode::UpstreamError,
                                       "Messages API request failed",
                                       result.error().what()));
    }

    co_return BackendReply{
        .status = result->status,
        .body = parse_reply_body(result->status, result->body),
    };
}

auto MessagesClient::stream(const json& request, EventCallback on_event)
    -> awaitable<Result<BackendReply>> {
    auto body = request;
    body["stream"] = true;

    LOG_DEBUG("Messages stream request: model={}", model_name(body));

    // The decoder lives on the reader thread for the whole request.
    auto decoder = std::make_shared<stream::SseDecoder>();
    auto result = co_await http_->post_stream(
        kMessagesPath, body.dump(), "application/json", {},
        [decoder, on_event](const char* data, size_t length) -> bool {
            for (auto& event : decoder->feed(std::string_view(data, length))) {
                if (!on_event(std::move(event))) return false;
            }
            return true;
        });

    if (!result) {
        co_return make_fail(make_error(ErrorCode::UpstreamError,
                                       "Messages API stream failed",
                                       result.error().what()));
    }

    if (!result->is_success()) {
        co_return BackendReply{
            .status = result->status,
            .body = parse_reply_body(result->status, result->body),
        };
    }

    for (auto& event : decoder->finish()) {
        if (!on_event(std::move(event))) break;
    }
    co_return BackendReply{.status = result->status, .body = nullptr};
}

} // namespace chatbridge::backend
