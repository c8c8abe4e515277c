#include "chatbridge/stream/stream_writer.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "chatbridge/core/logger.hpp"
#include "chatbridge/stream/sse.hpp"

namespace chatbridge::stream {

namespace {

auto write_frame(ChunkSink& sink, std::string frame) -> awaitable<VoidResult> {
    auto written = co_await sink.write(std::move(frame));
    if (!written) co_return make_fail(written.error());
    co_return co_await sink.flush();
}

} // anonymous namespace

auto write_source_stream(EventSource& source, ChunkSink& sink,
                         const translate::StreamContext& ctx)
    -> awaitable<VoidResult> {
    translate::StreamState state;
    std::size_t event_count = 0;

    while (true) {
        auto next = co_await source.next();
        if (!next) {
            LOG_WARN("Stream {} cut off after {} events: {}",
                     ctx.response_id, event_count, next.error().what());
            co_return make_fail(next.error());
        }
        if (!next->has_value()) break;
        ++event_count;

        for (auto& chunk : translate::translate_event(**next, state, ctx)) {
            auto written = co_await write_frame(sink, encode_data_frame(chunk));
            if (!written) co_return make_fail(written.error());
        }

        // An error event produced the terminal chunk; translation ends here.
        if (state.terminated) break;
    }

    if (auto last = translate::finish_stream(state, ctx)) {
        auto written = co_await write_frame(sink, encode_data_frame(*last));
        if (!written) co_return make_fail(written.error());
    }

    auto done = co_await write_frame(sink, std::string(kDoneFrame));
    if (!done) co_return make_fail(done.error());

    LOG_DEBUG("Stream {} finished after {} events ({} tool calls)",
              ctx.response_id, event_count, state.tool_slot_index + 1);
    co_return ok_result();
}

VectorEventSource::VectorEventSource(std::vector<json> events)
    : events_(std::move(events)) {}

auto VectorEventSource::next() -> awaitable<Result<std::optional<json>>> {
    if (pos_ >= events_.size()) {
        co_return std::optional<json>{};
    }
    co_return std::optional<json>(std::move(events_[pos_++]));
}

QueuedEventSource::QueuedEventSource(boost::asio::any_io_executor executor)
    : timer_(std::move(executor)) {}

void QueuedEventSource::push(json event) {
    {
        std::lock_guard lock(mtx_);
        queue_.push_back(std::move(event));
    }
    wake();
}

void QueuedEventSource::close() {
    {
        std::lock_guard lock(mtx_);
        closed_ = true;
    }
    wake();
}

void QueuedEventSource::fail(Error error) {
    {
        std::lock_guard lock(mtx_);
        error_ = std::move(error);
    }
    wake();
}

void QueuedEventSource::wake() {
    // The cancel runs on the consumer's executor, so it cannot slip in
    // between the emptiness check in next() and the wait that follows it.
    boost::asio::post(timer_.get_executor(), [this] { timer_.cancel(); });
}

auto QueuedEventSource::next() -> awaitable<Result<std::optional<json>>> {
    while (true) {
        {
            std::lock_guard lock(mtx_);
            if (!queue_.empty()) {
                auto event = std::move(queue_.front());
                queue_.pop_front();
                co_return std::optional<json>(std::move(event));
            }
            if (error_) {
                co_return make_fail(*error_);
            }
            if (closed_) {
                co_return std::optional<json>{};
            }
        }

        timer_.expires_at(boost::asio::steady_timer::time_point::max());
        boost::system::error_code ec;
        co_await timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

auto OstreamSink::write(std::string frame) -> awaitable<VoidResult> {
    os_ << frame;
    if (!os_) {
        co_return make_fail(make_error(ErrorCode::IoError, "Failed to write stream frame"));
    }
    co_return ok_result();
}

auto OstreamSink::flush() -> awaitable<VoidResult> {
    os_.flush();
    if (!os_) {
        co_return make_fail(make_error(ErrorCode::IoError, "Failed to flush stream"));
    }
    co_return ok_result();
}

} // namespace chatbridge::stream
