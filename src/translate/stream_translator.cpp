#include "chatbridge/translate/stream_translator.hpp"

#include <utility>

#include "chatbridge/core/logger.hpp"
#include "chatbridge/core/utils.hpp"
#include "chatbridge/stream/sse.hpp"
#include "chatbridge/translate/mapping_tables.hpp"
#include "chatbridge/translate/response_mapper.hpp"

namespace chatbridge::translate {

namespace {

constexpr auto kThinkingOpen = "<thinking>\n";
constexpr auto kThinkingClose = "\n</thinking>\n";

auto make_chunk(const StreamContext& ctx, json delta, json finish_reason = nullptr) -> json {
    json choice = {
        {"index", 0},
        {"delta", std::move(delta)},
        {"logprobs", nullptr},
        {"finish_reason", std::move(finish_reason)},
    };
    return {
        {"id", ctx.response_id},
        {"object", std::string(kChunkObject)},
        {"created", ctx.created},
        {"model", ctx.model},
        {"choices", json::array({std::move(choice)})},
        {"system_fingerprint", nullptr},
    };
}

auto content_delta(std::string text) -> json {
    return {{"content", std::move(text)}};
}

auto string_at(const json& obj, const char* key) -> std::string {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

auto object_at(const json& obj, const char* key) -> const json& {
    static const json empty = json::object();
    if (obj.is_object() && obj.contains(key) && obj[key].is_object()) {
        return obj[key];
    }
    return empty;
}

auto on_block_start(const json& event, StreamState& state, const StreamContext& ctx)
    -> std::vector<json> {
    const auto& block = object_at(event, "content_block");
    auto type = string_at(block, "type");

    if (type == "thinking") {
        state.open_block = BlockKind::Thinking;
        if (!ctx.include_thinking) return {};
        return {make_chunk(ctx, content_delta(kThinkingOpen))};
    }

    if (type == "tool_use") {
        ++state.tool_slot_index;
        state.tool_invocation_id = string_at(block, "id");
        state.open_block = BlockKind::Tool;

        json call = {
            {"index", state.tool_slot_index},
            {"id", state.tool_invocation_id},
            {"type", "function"},
            {"function", {
                {"name", string_at(block, "name")},
                {"arguments", ""},
            }},
        };
        return {make_chunk(ctx, {{"tool_calls", json::array({std::move(call)})}})};
    }

    if (type == "text") {
        state.open_block = BlockKind::Text;
    } else {
        LOG_DEBUG("Stream: content block of type '{}' has no source equivalent", type);
        state.open_block = BlockKind::None;
    }
    return {};
}

auto on_block_delta(const json& event, StreamState& state, const StreamContext& ctx)
    -> std::vector<json> {
    const auto& delta = object_at(event, "delta");
    auto type = string_at(delta, "type");

    if (type == "text_delta") {
        return {make_chunk(ctx, content_delta(string_at(delta, "text")))};
    }

    if (type == "thinking_delta") {
        if (state.open_block == BlockKind::Thinking && ctx.include_thinking) {
            return {make_chunk(ctx, content_delta(string_at(delta, "thinking")))};
        }
        return {};
    }

    if (type == "input_json_delta") {
        if (state.open_block != BlockKind::Tool || state.tool_slot_index < 0) {
            LOG_DEBUG("Stream: dropping argument fragment outside a tool block");
            return {};
        }
        // Continuation fragments carry no id or name.
        json call = {
            {"index", state.tool_slot_index},
            {"function", {{"arguments", string_at(delta, "partial_json")}}},
        };
        return {make_chunk(ctx, {{"tool_calls", json::array({std::move(call)})}})};
    }

    if (type != "signature_delta") {
        LOG_DEBUG("Stream: ignoring delta of type '{}'", type);
    }
    return {};
}

auto on_block_stop(StreamState& state, const StreamContext& ctx) -> std::vector<json> {
    bool close_thinking = state.open_block == BlockKind::Thinking && ctx.include_thinking;
    state.open_block = BlockKind::None;
    state.tool_invocation_id.clear();
    if (!close_thinking) return {};
    return {make_chunk(ctx, content_delta(kThinkingClose))};
}

} // anonymous namespace

auto parse_event_kind(std::string_view type) -> EventKind {
    if (type == "message_start") return EventKind::MessageStart;
    if (type == "content_block_start") return EventKind::ContentBlockStart;
    if (type == "content_block_delta") return EventKind::ContentBlockDelta;
    if (type == "content_block_stop") return EventKind::ContentBlockStop;
    if (type == "message_delta") return EventKind::MessageDelta;
    if (type == "message_stop") return EventKind::MessageStop;
    if (type == "ping") return EventKind::Ping;
    if (type == "error") return EventKind::Error;
    return EventKind::Unknown;
}

auto make_stream_context(std::string model, bool include_thinking) -> StreamContext {
    return StreamContext{
        .response_id = make_response_id(),
        .created = utils::unix_timestamp(),
        .model = std::move(model),
        .include_thinking = include_thinking,
    };
}

auto translate_event(const json& event, StreamState& state, const StreamContext& ctx)
    -> std::vector<json> {
    if (state.terminated) {
        LOG_DEBUG("Stream: ignoring event after termination");
        return {};
    }

    auto type = string_at(event, "type");
    switch (parse_event_kind(type)) {
        case EventKind::MessageStart: {
            if (state.initial_chunk_sent) return {};
            state.initial_chunk_sent = true;
            return {make_chunk(ctx, {{"role", "assistant"}, {"content", ""}})};
        }

        case EventKind::ContentBlockStart:
            return on_block_start(event, state, ctx);

        case EventKind::ContentBlockDelta:
            return on_block_delta(event, state, ctx);

        case EventKind::ContentBlockStop:
            return on_block_stop(state, ctx);

        case EventKind::MessageDelta: {
            auto stop_reason = string_at(object_at(event, "delta"), "stop_reason");
            if (!stop_reason.empty()) {
                state.finish_reason = finish_reason_from_stop_reason(stop_reason);
            }
            return {};
        }

        case EventKind::MessageStop:
        case EventKind::Ping:
            return {};

        case EventKind::Error: {
            auto message = string_at(object_at(event, "error"), "message");
            LOG_WARN("Stream: upstream error event: {}", message);
            auto chunk = make_chunk(ctx, json::object(), "stop");
            chunk["error"] = {
                {"message", message.empty() ? std::string("An error occurred") : message},
                {"type", "api_error"},
            };
            state.terminated = true;
            return {std::move(chunk)};
        }

        case EventKind::Unknown:
            break;
    }

    LOG_DEBUG("Stream: ignoring event of type '{}'", type);
    return {};
}

auto finish_stream(StreamState& state, const StreamContext& ctx) -> std::optional<json> {
    if (state.terminated) return std::nullopt;
    state.terminated = true;
    return make_chunk(ctx, json::object(), state.finish_reason.value_or(FinishReason::Stop));
}

auto translate_stream(const std::vector<json>& events, const StreamContext& ctx)
    -> std::vector<std::string> {
    StreamState state;
    std::vector<std::string> frames;

    for (const auto& event : events) {
        for (const auto& chunk : translate_event(event, state, ctx)) {
            frames.push_back(stream::encode_data_frame(chunk));
        }
    }
    if (auto last = finish_stream(state, ctx)) {
        frames.push_back(stream::encode_data_frame(*last));
    }
    frames.emplace_back(stream::kDoneFrame);
    return frames;
}

} // namespace chatbridge::translate
