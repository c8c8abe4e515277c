#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "chatbridge/core/config.hpp"
#include "chatbridge/core/error.hpp"
#include "chatbridge/infra/http_client.hpp"

namespace chatbridge::backend {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Status and parsed body of a Messages API call. For streaming calls
/// that succeeded the body is null (the events went to the callback).
struct BackendReply {
    int status = 0;
    json body;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Invoked once per decoded stream event, on the HTTP reader thread.
/// Return false to abort the stream.
using EventCallback = std::function<bool(json event)>;

/// Client for the Messages API (`POST /v1/messages`). No retries.
class MessagesClient {
public:
    MessagesClient(boost::asio::io_context& ioc, const BackendConfig& config);

    /// Use a caller-supplied transport. Authentication headers are the
    /// transport's responsibility.
    MessagesClient(std::unique_ptr<infra::HttpTransport> transport,
                   const BackendConfig& config);
    ~MessagesClient();

    MessagesClient(const MessagesClient&) = delete;
    MessagesClient& operator=(const MessagesClient&) = delete;

    /// Send a non-streaming request.
    auto complete(const json& request) -> awaitable<Result<BackendReply>>;

    /// Send a streaming request. Events are decoded incrementally and
    /// passed to `on_event` as they arrive. A non-2xx reply carries the
    /// parsed error body instead.
    auto stream(const json& request, EventCallback on_event)
        -> awaitable<Result<BackendReply>>;

private:
    std::unique_ptr<infra::HttpTransport> http_;
};

/// Parse a reply body, wrapping non-JSON text in an error envelope so the
/// error mapper can still read it.
auto parse_reply_body(int status, const std::string& body) -> json;

} // namespace chatbridge::backend
