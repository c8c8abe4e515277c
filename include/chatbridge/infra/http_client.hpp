#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>

#include "chatbridge/core/error.hpp"

namespace chatbridge::infra {

/// Callback invoked for each chunk of response data during streaming.
/// Return true to continue receiving data, false to abort the request.
using HttpChunkCallback = std::function<bool(const char* data, size_t length)>;

struct HttpResponse {
    int status = 0;
    std::string body;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Awaitable POST transport. HttpClient is the production implementation;
/// tests substitute their own.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Performs an asynchronous HTTP POST request.
    virtual auto post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
        -> boost::asio::awaitable<Result<HttpResponse>> = 0;

    /// Performs a streaming HTTP POST request. The chunk_callback is
    /// invoked for each chunk of a 2xx response body as it arrives, possibly
    /// on another thread. For error responses (non-2xx), the body is
    /// buffered and returned in HttpResponse::body.
    virtual auto post_stream(std::string_view path,
                             std::string_view body,
                             std::string_view content_type,
                             const std::map<std::string, std::string>& headers,
                             HttpChunkCallback chunk_callback)
        -> boost::asio::awaitable<Result<HttpResponse>> = 0;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
/// Each request runs on a background thread and resumes the calling
/// coroutine on the io_context when done.
class HttpClient final : public HttpTransport {
public:
    explicit HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type,
              const std::map<std::string, std::string>& headers)
        -> boost::asio::awaitable<Result<HttpResponse>> override;

    auto post_stream(std::string_view path,
                     std::string_view body,
                     std::string_view content_type,
                     const std::map<std::string, std::string>& headers,
                     HttpChunkCallback chunk_callback)
        -> boost::asio::awaitable<Result<HttpResponse>> override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chatbridge::infra
