#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "chatbridge/core/error.hpp"
#include "chatbridge/translate/stream_translator.hpp"

namespace chatbridge::stream {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Ordered sequence of inbound Messages API stream events.
class EventSource {
public:
    virtual ~EventSource() = default;

    /// Next event, or nullopt once the sequence is exhausted. An error
    /// means the sequence was cut off before its natural end.
    virtual auto next() -> awaitable<Result<std::optional<json>>> = 0;
};

/// Destination for outbound source-protocol SSE frames.
class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    virtual auto write(std::string frame) -> awaitable<VoidResult> = 0;

    /// Push buffered frames to the peer. Sinks without buffering keep the
    /// default no-op.
    virtual auto flush() -> awaitable<VoidResult> { co_return ok_result(); }
};

/// Pull events from `source` one at a time, translate each, and write
/// and flush every produced frame before pulling the next event. Ends
/// with the terminal chunk and the `[DONE]` frame.
///
/// When the source is cut off, the error is returned and no terminal
/// chunk is written; deciding how to close the transport is the caller's
/// job.
auto write_source_stream(EventSource& source, ChunkSink& sink,
                         const translate::StreamContext& ctx)
    -> awaitable<VoidResult>;

/// Event source over an in-memory list.
class VectorEventSource final : public EventSource {
public:
    explicit VectorEventSource(std::vector<json> events);

    auto next() -> awaitable<Result<std::optional<json>>> override;

private:
    std::vector<json> events_;
    std::size_t pos_ = 0;
};

/// Event source fed from another thread (e.g. an HTTP reader).
///
/// `push`, `close` and `fail` may be called from any thread. `next` must
/// be awaited on `executor`, which has to be single-threaded (an
/// io_context run by one thread, or a strand). The source must outlive
/// every producer call.
class QueuedEventSource final : public EventSource {
public:
    explicit QueuedEventSource(boost::asio::any_io_executor executor);

    QueuedEventSource(const QueuedEventSource&) = delete;
    QueuedEventSource& operator=(const QueuedEventSource&) = delete;

    void push(json event);
    /// Mark the natural end of the sequence.
    void close();
    /// Mark an abrupt end of the sequence.
    void fail(Error error);

    auto next() -> awaitable<Result<std::optional<json>>> override;

private:
    void wake();

    boost::asio::steady_timer timer_;
    std::mutex mtx_;
    std::deque<json> queue_;
    bool closed_ = false;
    std::optional<Error> error_;
};

/// Sink writing frames to a std::ostream (stdout for the CLI).
class OstreamSink final : public ChunkSink {
public:
    explicit OstreamSink(std::ostream& os) : os_(os) {}

    auto write(std::string frame) -> awaitable<VoidResult> override;
    auto flush() -> awaitable<VoidResult> override;

private:
    std::ostream& os_;
};

} // namespace chatbridge::stream
