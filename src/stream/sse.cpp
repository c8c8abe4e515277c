#include "chatbridge/stream/sse.hpp"

#include <iterator>

#include "chatbridge/core/logger.hpp"

namespace chatbridge::stream {

namespace {

/// Value of an SSE field line: text after the colon, minus one leading space.
auto field_value(std::string_view line, std::size_t colon) -> std::string_view {
    auto value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
    }
    return value;
}

} // anonymous namespace

auto encode_data_frame(const json& chunk) -> std::string {
    return "data: " + chunk.dump() + "\n\n";
}

auto SseDecoder::feed(std::string_view bytes) -> std::vector<json> {
    std::vector<json> out;
    buffer_.append(bytes);

    std::size_t start = 0;
    while (true) {
        auto nl = buffer_.find('\n', start);
        if (nl == std::string::npos) break;

        std::string_view line(buffer_.data() + start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        process_line(line, out);
        start = nl + 1;
    }
    buffer_.erase(0, start);
    return out;
}

auto SseDecoder::finish() -> std::vector<json> {
    std::vector<json> out;
    if (!buffer_.empty()) {
        std::string rest = std::move(buffer_);
        buffer_.clear();
        if (!rest.empty() && rest.back() == '\r') rest.pop_back();
        process_line(rest, out);
    }
    dispatch(out);
    return out;
}

auto SseDecoder::decode_all(std::string_view body) -> std::vector<json> {
    SseDecoder decoder;
    auto events = decoder.feed(body);
    auto tail = decoder.finish();
    events.insert(events.end(),
                  std::make_move_iterator(tail.begin()),
                  std::make_move_iterator(tail.end()));
    return events;
}

void SseDecoder::process_line(std::string_view line, std::vector<json>& out) {
    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line.front() == ':') return;

    auto colon = line.find(':');
    auto field = colon == std::string_view::npos ? line : line.substr(0, colon);
    auto value = colon == std::string_view::npos ? std::string_view{} : field_value(line, colon);

    if (field == "data") {
        if (has_data_) data_ += '\n';
        data_.append(value);
        has_data_ = true;
    } else if (field == "event") {
        event_name_.assign(value);
    }
    // id and retry fields carry nothing the translator needs.
}

void SseDecoder::dispatch(std::vector<json>& out) {
    if (has_data_ && data_ != "[DONE]") {
        auto parsed = json::parse(data_, nullptr, false);
        if (parsed.is_discarded()) {
            LOG_WARN("SSE: skipping undecodable event payload: {}", data_);
        } else {
            if (parsed.is_object() && !parsed.contains("type") && !event_name_.empty()) {
                parsed["type"] = event_name_;
            }
            out.push_back(std::move(parsed));
        }
    }
    data_.clear();
    event_name_.clear();
    has_data_ = false;
}

} // namespace chatbridge::stream
