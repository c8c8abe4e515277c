#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatbridge/core/types.hpp"

namespace chatbridge::translate {

using json = nlohmann::json;

/// Kinds of inbound Messages API stream events.
enum class EventKind {
    MessageStart,
    ContentBlockStart,
    ContentBlockDelta,
    ContentBlockStop,
    MessageDelta,
    MessageStop,
    Ping,
    Error,
    Unknown,
};

auto parse_event_kind(std::string_view type) -> EventKind;

/// Per-stream translation state. Owned by the caller for the lifetime of
/// exactly one inbound event sequence; never shared between streams.
struct StreamState {
    BlockKind open_block = BlockKind::None;
    /// Last assigned source-protocol tool-call slot; -1 before the first.
    int tool_slot_index = -1;
    /// Invocation id bound to the currently open tool block.
    std::string tool_invocation_id;
    bool initial_chunk_sent = false;
    std::optional<FinishReason> finish_reason;
    /// Set once an error event has produced the terminal chunk.
    bool terminated = false;
};

/// Immutable per-stream values stamped on every outbound chunk.
struct StreamContext {
    std::string response_id;
    int64_t created = 0;
    std::string model;
    bool include_thinking = false;
};

/// Context with a fresh random `chatcmpl-` id and the current time.
auto make_stream_context(std::string model, bool include_thinking) -> StreamContext;

/// Translate one inbound event into zero or more outbound chunk objects,
/// updating `state`. Produces output incrementally, without lookahead.
auto translate_event(const json& event, StreamState& state, const StreamContext& ctx)
    -> std::vector<json>;

/// The terminal chunk emitted once the inbound sequence is exhausted:
/// empty delta and the recorded finish reason (stop when none was
/// recorded). Returns nullopt when an error event already terminated the
/// stream.
auto finish_stream(StreamState& state, const StreamContext& ctx) -> std::optional<json>;

/// Translate a complete event sequence into SSE frames, including the
/// terminal chunk and the `[DONE]` marker.
auto translate_stream(const std::vector<json>& events, const StreamContext& ctx)
    -> std::vector<std::string>;

} // namespace chatbridge::translate
