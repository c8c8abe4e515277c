#include "chatbridge/infra/http_client.hpp"
#include "chatbridge/core/logger.hpp"

#include <httplib.h>

#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace chatbridge::infra {

namespace {

auto describe(httplib::Error err) -> std::string {
    switch (err) {
        case httplib::Error::Connection: return "Connection failed";
        case httplib::Error::BindIPAddress: return "Bind IP address failed";
        case httplib::Error::Read: return "Read error";
        case httplib::Error::Write: return "Write error";
        case httplib::Error::ExceedRedirectCount: return "Exceeded redirect count";
        case httplib::Error::Canceled: return "Request canceled";
        case httplib::Error::SSLConnection: return "SSL connection error";
        case httplib::Error::SSLLoadingCerts: return "SSL certificate loading error";
        case httplib::Error::SSLServerVerification: return "SSL server verification failed";
        case httplib::Error::ConnectionTimeout: return "Connection timeout";
        default: return "httplib error code " + std::to_string(static_cast<int>(err));
    }
}

auto transport_error(httplib::Error err) -> Error {
    if (err == httplib::Error::ConnectionTimeout) {
        return make_error(ErrorCode::Timeout, "HTTP request timed out", describe(err));
    }
    return make_error(ErrorCode::ConnectionFailed, "HTTP request failed", describe(err));
}

/// Fresh client per request: httplib::Client is not thread-safe and every
/// request runs on its own thread.
auto make_client(const HttpClientConfig& config) -> std::unique_ptr<httplib::Client> {
    auto client = std::make_unique<httplib::Client>(config.base_url);
    client->set_connection_timeout(config.timeout_seconds);
    client->set_read_timeout(config.timeout_seconds);
    client->set_write_timeout(config.timeout_seconds);
    if (!config.verify_ssl) {
        client->enable_server_certificate_verification(false);
    }

    httplib::Headers hdrs;
    for (const auto& [key, value] : config.default_headers) {
        hdrs.emplace(key, value);
    }
    client->set_default_headers(hdrs);
    return client;
}

auto to_headers(const std::map<std::string, std::string>& extra) -> httplib::Headers {
    httplib::Headers hdrs;
    for (const auto& [k, v] : extra) {
        hdrs.emplace(k, v);
    }
    return hdrs;
}

/// Runs `work` on a detached thread and suspends the calling coroutine
/// until it has produced a result.
template <typename Work>
auto run_blocking(boost::asio::io_context& ioc, Work work)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    struct State {
        std::mutex mtx;
        std::optional<Result<HttpResponse>> result;
    };

    auto state = std::make_shared<State>();
    auto timer = std::make_shared<boost::asio::steady_timer>(
        ioc, boost::asio::steady_timer::time_point::max());

    std::thread([state, timer, work = std::move(work)]() mutable {
        auto result = work();
        {
            std::lock_guard lock(state->mtx);
            state->result = std::move(result);
        }
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    }).detach();

    boost::system::error_code ec;
    co_await timer->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    std::lock_guard lock(state->mtx);
    if (!state->result.has_value()) {
        // Timer was cancelled by io_context shutdown, not by the worker.
        co_return make_fail(make_error(ErrorCode::ConnectionClosed,
                                       "HTTP request was cancelled", ec.message()));
    }
    co_return std::move(*state->result);
}

} // anonymous namespace

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;

    Impl(boost::asio::io_context& ioc_, HttpClientConfig config_)
        : ioc(ioc_), config(std::move(config_)) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }
};

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    co_return co_await run_blocking(impl_->ioc,
        [config = impl_->config, p = std::string(path), b = std::string(body),
         ct = std::string(content_type), hdrs = to_headers(headers)]()
            -> Result<HttpResponse> {
            LOG_DEBUG("POST {}{}", config.base_url, p);
            auto client = make_client(config);
            auto res = client->Post(p, hdrs, b, ct);
            if (!res) {
                return std::unexpected(transport_error(res.error()));
            }

            HttpResponse response;
            response.status = res->status;
            response.body = res->body;
            return response;
        });
}

auto HttpClient::post_stream(std::string_view path,
                             std::string_view body,
                             std::string_view content_type,
                             const std::map<std::string, std::string>& headers,
                             HttpChunkCallback chunk_cb)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    co_return co_await run_blocking(impl_->ioc,
        [config = impl_->config, chunk_cb = std::move(chunk_cb),
         p = std::string(path), b = std::string(body),
         ct = std::string(content_type), hdrs = to_headers(headers)]()
            -> Result<HttpResponse> {
            LOG_DEBUG("POST (stream) {}{}", config.base_url, p);
            auto client = make_client(config);

            httplib::Request req;
            req.method = "POST";
            req.path = p;
            req.headers = hdrs;
            req.body = b;
            req.set_header("Content-Type", ct);

            // Successful bodies are streamed; error bodies are buffered.
            int status_code = 0;
            std::string error_body;

            req.response_handler = [&status_code](const httplib::Response& r) -> bool {
                status_code = r.status;
                return true;
            };

            req.content_receiver =
                [&chunk_cb, &error_body, &status_code](
                    const char* data, size_t data_length,
                    uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
                    if (status_code >= 200 && status_code < 300) {
                        return chunk_cb(data, data_length);
                    }
                    error_body.append(data, data_length);
                    return true;
                };

            httplib::Response res;
            httplib::Error error = httplib::Error::Success;
            if (!client->send(req, res, error)) {
                return std::unexpected(transport_error(error));
            }

            HttpResponse response;
            response.status = res.status;
            response.body = std::move(error_body);
            LOG_DEBUG("POST (stream) finished, status={}", response.status);
            return response;
        });
}

} // namespace chatbridge::infra
