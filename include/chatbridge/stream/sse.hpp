#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatbridge::stream {

using json = nlohmann::json;

/// Terminator frame of a source-protocol stream.
inline constexpr std::string_view kDoneFrame = "data: [DONE]\n\n";

/// Encode one chunk object as a `data: <json>\n\n` frame.
auto encode_data_frame(const json& chunk) -> std::string;

/// Incremental decoder for a Server-Sent Events byte stream.
///
/// Input may be split at arbitrary byte boundaries. An event is complete
/// at the first blank line; its `data:` lines are joined with '\n' and
/// parsed as JSON. When the payload has no `type` member, the `event:`
/// field name is copied into it. Comments, `[DONE]` markers and payloads
/// that are not valid JSON are skipped.
class SseDecoder {
public:
    /// Feed raw bytes; returns the events completed by this chunk, in order.
    auto feed(std::string_view bytes) -> std::vector<json>;

    /// Flush a trailing event that was not followed by a blank line.
    auto finish() -> std::vector<json>;

    /// Decode a complete SSE body in one call.
    static auto decode_all(std::string_view body) -> std::vector<json>;

private:
    void process_line(std::string_view line, std::vector<json>& out);
    void dispatch(std::vector<json>& out);

    std::string buffer_;
    std::string event_name_;
    std::string data_;
    bool has_data_ = false;
};

} // namespace chatbridge::stream
