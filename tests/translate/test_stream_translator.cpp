#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "chatbridge/translate/stream_translator.hpp"

using namespace chatbridge;
using namespace chatbridge::translate;

namespace {

auto test_context(bool include_thinking = false) -> StreamContext {
    return StreamContext{
        .response_id = "chatcmpl-test",
        .created = 1700000000,
        .model = "claude-sonnet-4",
        .include_thinking = include_thinking,
    };
}

auto message_start() -> json {
    return {{"type", "message_start"},
            {"message", {{"id", "msg_1"}, {"model", "claude-sonnet-4"}, {"content", json::array()}}}};
}

auto block_start(int index, json block) -> json {
    return {{"type", "content_block_start"}, {"index", index}, {"content_block", std::move(block)}};
}

auto text_delta(int index, const char* text) -> json {
    return {{"type", "content_block_delta"}, {"index", index},
            {"delta", {{"type", "text_delta"}, {"text", text}}}};
}

auto thinking_delta(int index, const char* text) -> json {
    return {{"type", "content_block_delta"}, {"index", index},
            {"delta", {{"type", "thinking_delta"}, {"thinking", text}}}};
}

auto json_delta(int index, const char* partial) -> json {
    return {{"type", "content_block_delta"}, {"index", index},
            {"delta", {{"type", "input_json_delta"}, {"partial_json", partial}}}};
}

auto block_stop(int index) -> json {
    return {{"type", "content_block_stop"}, {"index", index}};
}

auto message_delta(const char* stop_reason) -> json {
    return {{"type", "message_delta"}, {"delta", {{"stop_reason", stop_reason}}},
            {"usage", {{"output_tokens", 12}}}};
}

auto message_stop() -> json {
    return {{"type", "message_stop"}};
}

auto tool_block(const char* id, const char* name) -> json {
    return {{"type", "tool_use"}, {"id", id}, {"name", name}, {"input", json::object()}};
}

/// Translate a whole sequence and collect the chunk objects plus the
/// terminal chunk, without SSE framing.
auto run(const std::vector<json>& events, const StreamContext& ctx) -> std::vector<json> {
    StreamState state;
    std::vector<json> chunks;
    for (const auto& event : events) {
        for (auto& chunk : translate_event(event, state, ctx)) {
            chunks.push_back(std::move(chunk));
        }
    }
    if (auto last = finish_stream(state, ctx)) {
        chunks.push_back(std::move(*last));
    }
    return chunks;
}

auto delta_of(const json& chunk) -> const json& {
    return chunk["choices"][0]["delta"];
}

auto finish_of(const json& chunk) -> const json& {
    return chunk["choices"][0]["finish_reason"];
}

} // anonymous namespace

TEST_CASE("parse_event_kind", "[translate][stream]") {
    CHECK(parse_event_kind("message_start") == EventKind::MessageStart);
    CHECK(parse_event_kind("content_block_start") == EventKind::ContentBlockStart);
    CHECK(parse_event_kind("content_block_delta") == EventKind::ContentBlockDelta);
    CHECK(parse_event_kind("content_block_stop") == EventKind::ContentBlockStop);
    CHECK(parse_event_kind("message_delta") == EventKind::MessageDelta);
    CHECK(parse_event_kind("message_stop") == EventKind::MessageStop);
    CHECK(parse_event_kind("ping") == EventKind::Ping);
    CHECK(parse_event_kind("error") == EventKind::Error);
    CHECK(parse_event_kind("something") == EventKind::Unknown);
}

TEST_CASE("text stream translation", "[translate][stream]") {
    auto ctx = test_context();
    auto chunks = run({
        message_start(),
        block_start(0, {{"type", "text"}, {"text", ""}}),
        text_delta(0, "Hi"),
        text_delta(0, " there"),
        block_stop(0),
        message_delta("end_turn"),
        message_stop(),
    }, ctx);

    REQUIRE(chunks.size() == 4);

    SECTION("role chunk first") {
        CHECK(delta_of(chunks[0]) == json{{"role", "assistant"}, {"content", ""}});
        CHECK(finish_of(chunks[0]).is_null());
    }

    SECTION("text fragments in order") {
        CHECK(delta_of(chunks[1]) == json{{"content", "Hi"}});
        CHECK(delta_of(chunks[2]) == json{{"content", " there"}});
        CHECK(finish_of(chunks[1]).is_null());
    }

    SECTION("terminal chunk last") {
        CHECK(delta_of(chunks[3]) == json::object());
        CHECK(finish_of(chunks[3]) == "stop");
    }

    SECTION("chunk envelope") {
        for (const auto& chunk : chunks) {
            CHECK(chunk["id"] == "chatcmpl-test");
            CHECK(chunk["object"] == "chat.completion.chunk");
            CHECK(chunk["created"] == 1700000000);
            CHECK(chunk["model"] == "claude-sonnet-4");
            CHECK(chunk["system_fingerprint"].is_null());
            CHECK(chunk["choices"].size() == 1);
            CHECK(chunk["choices"][0]["index"] == 0);
            CHECK(chunk["choices"][0]["logprobs"].is_null());
        }
    }
}

TEST_CASE("tool call stream translation", "[translate][stream]") {
    auto ctx = test_context();
    auto chunks = run({
        message_start(),
        block_start(0, {{"type", "text"}, {"text", ""}}),
        text_delta(0, "Checking."),
        block_stop(0),
        block_start(1, tool_block("toolu_a", "get_weather")),
        json_delta(1, "{\"city\":"),
        json_delta(1, "\"Paris\"}"),
        block_stop(1),
        block_start(2, tool_block("toolu_b", "get_time")),
        json_delta(2, "{}"),
        block_stop(2),
        message_delta("tool_use"),
        message_stop(),
    }, ctx);

    REQUIRE(chunks.size() == 8);

    SECTION("tool open carries id and name") {
        const auto& call = delta_of(chunks[2])["tool_calls"][0];
        CHECK(call["index"] == 0);
        CHECK(call["id"] == "toolu_a");
        CHECK(call["type"] == "function");
        CHECK(call["function"]["name"] == "get_weather");
        CHECK(call["function"]["arguments"] == "");
    }

    SECTION("argument fragments carry no id or name") {
        const auto& first = delta_of(chunks[3])["tool_calls"][0];
        CHECK(first["index"] == 0);
        CHECK_FALSE(first.contains("id"));
        CHECK_FALSE(first["function"].contains("name"));
        CHECK(first["function"]["arguments"] == "{\"city\":");
        CHECK(delta_of(chunks[4])["tool_calls"][0]["function"]["arguments"] == "\"Paris\"}");
    }

    SECTION("slot indices increase from zero") {
        const auto& second = delta_of(chunks[5])["tool_calls"][0];
        CHECK(second["index"] == 1);
        CHECK(second["id"] == "toolu_b");
        CHECK(delta_of(chunks[6])["tool_calls"][0]["index"] == 1);
    }

    SECTION("finish reason recorded from message_delta") {
        CHECK(finish_of(chunks[7]) == "tool_calls");
        for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
            CHECK(finish_of(chunks[i]).is_null());
        }
    }
}

TEST_CASE("thinking blocks", "[translate][stream]") {
    std::vector<json> events = {
        message_start(),
        block_start(0, {{"type", "thinking"}, {"thinking", ""}}),
        thinking_delta(0, "Let me think."),
        {{"type", "content_block_delta"}, {"index", 0},
         {"delta", {{"type", "signature_delta"}, {"signature", "abc"}}}},
        block_stop(0),
        block_start(1, {{"type", "text"}, {"text", ""}}),
        text_delta(1, "Answer"),
        block_stop(1),
        message_stop(),
    };

    SECTION("suppressed by default") {
        auto chunks = run(events, test_context(false));
        REQUIRE(chunks.size() == 3);
        CHECK(delta_of(chunks[1]) == json{{"content", "Answer"}});
    }

    SECTION("wrapped in markers when included") {
        auto chunks = run(events, test_context(true));
        REQUIRE(chunks.size() == 6);
        CHECK(delta_of(chunks[1]) == json{{"content", "<thinking>\n"}});
        CHECK(delta_of(chunks[2]) == json{{"content", "Let me think."}});
        CHECK(delta_of(chunks[3]) == json{{"content", "\n</thinking>\n"}});
        CHECK(delta_of(chunks[4]) == json{{"content", "Answer"}});
        CHECK(finish_of(chunks[5]) == "stop");
    }
}

TEST_CASE("stream state transitions", "[translate][stream]") {
    auto ctx = test_context();
    StreamState state;

    CHECK(state.open_block == BlockKind::None);
    CHECK(state.tool_slot_index == -1);

    translate_event(message_start(), state, ctx);
    CHECK(state.initial_chunk_sent);

    SECTION("duplicate message_start emits nothing") {
        CHECK(translate_event(message_start(), state, ctx).empty());
    }

    SECTION("tool block binds the invocation id until it closes") {
        translate_event(block_start(0, tool_block("toolu_x", "f")), state, ctx);
        CHECK(state.open_block == BlockKind::Tool);
        CHECK(state.tool_slot_index == 0);
        CHECK(state.tool_invocation_id == "toolu_x");

        translate_event(block_stop(0), state, ctx);
        CHECK(state.open_block == BlockKind::None);
        CHECK(state.tool_invocation_id.empty());
        CHECK(state.tool_slot_index == 0);
    }

    SECTION("argument fragment outside a tool block is dropped") {
        CHECK(translate_event(json_delta(0, "{}"), state, ctx).empty());
    }

    SECTION("message_delta never emits") {
        CHECK(translate_event(message_delta("max_tokens"), state, ctx).empty());
        REQUIRE(state.finish_reason.has_value());
        CHECK(*state.finish_reason == FinishReason::Length);
    }

    SECTION("ping and unknown events emit nothing") {
        CHECK(translate_event({{"type", "ping"}}, state, ctx).empty());
        CHECK(translate_event({{"type", "novel_event"}}, state, ctx).empty());
        CHECK(translate_event(json::object(), state, ctx).empty());
    }
}

TEST_CASE("finish_stream fires exactly once", "[translate][stream]") {
    auto ctx = test_context();
    StreamState state;

    auto first = finish_stream(state, ctx);
    REQUIRE(first.has_value());
    CHECK(finish_of(*first) == "stop");
    CHECK_FALSE(finish_stream(state, ctx).has_value());
}

TEST_CASE("error event terminates the stream", "[translate][stream]") {
    auto ctx = test_context();
    auto chunks = run({
        message_start(),
        block_start(0, {{"type", "text"}, {"text", ""}}),
        text_delta(0, "Partial"),
        {{"type", "error"}, {"error", {{"type", "overloaded_error"}, {"message", "Overloaded"}}}},
        text_delta(0, "ignored"),
    }, ctx);

    REQUIRE(chunks.size() == 3);
    const auto& terminal = chunks[2];
    CHECK(delta_of(terminal) == json::object());
    CHECK(finish_of(terminal) == "stop");
    CHECK(terminal["error"]["message"] == "Overloaded");
    CHECK(terminal["error"]["type"] == "api_error");
}

TEST_CASE("translate_stream frames", "[translate][stream]") {
    auto ctx = test_context();
    std::vector<json> events = {
        message_start(),
        block_start(0, {{"type", "text"}, {"text", ""}}),
        text_delta(0, "Hi"),
        block_stop(0),
        message_delta("end_turn"),
        message_stop(),
    };

    auto frames = translate_stream(events, ctx);
    REQUIRE(frames.size() == 4);
    CHECK(frames.back() == "data: [DONE]\n\n");

    for (std::size_t i = 0; i + 1 < frames.size(); ++i) {
        const auto& frame = frames[i];
        REQUIRE(frame.starts_with("data: "));
        REQUIRE(frame.ends_with("\n\n"));
        auto chunk = json::parse(frame.substr(6, frame.size() - 8));
        CHECK(chunk["object"] == "chat.completion.chunk");
    }

    SECTION("deterministic for a fixed context") {
        CHECK(translate_stream(events, ctx) == frames);
    }

    SECTION("empty input still terminates") {
        auto empty = translate_stream({}, ctx);
        REQUIRE(empty.size() == 2);
        CHECK(empty[1] == "data: [DONE]\n\n");
    }
}

TEST_CASE("make_stream_context", "[translate][stream]") {
    auto ctx = make_stream_context("m", true);
    CHECK(ctx.response_id.starts_with("chatcmpl-"));
    CHECK(ctx.created > 0);
    CHECK(ctx.model == "m");
    CHECK(ctx.include_thinking);
    CHECK(make_stream_context("m", false).response_id != ctx.response_id);
}
