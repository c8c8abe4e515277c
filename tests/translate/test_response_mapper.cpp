#include <catch2/catch_test_macros.hpp>

#include "chatbridge/translate/request_mapper.hpp"
#include "chatbridge/translate/response_mapper.hpp"

using namespace chatbridge;
using namespace chatbridge::translate;

namespace {

auto sample_response() -> json {
    return {
        {"id", "msg_01XYZ"},
        {"type", "message"},
        {"role", "assistant"},
        {"model", "claude-sonnet-4"},
        {"content", json::array({
            {{"type", "thinking"}, {"thinking", "Consider the weather."}, {"signature", "sig"}},
            {{"type", "text"}, {"text", "Let me check."}},
            {{"type", "tool_use"}, {"id", "toolu_1"}, {"name", "get_weather"},
             {"input", {{"city", "Paris"}}}},
        })},
        {"stop_reason", "tool_use"},
        {"usage", {{"input_tokens", 10}, {"output_tokens", 5}, {"cache_read_input_tokens", 3}}},
    };
}

} // anonymous namespace

TEST_CASE("map_response produces a chat.completion", "[translate][response]") {
    auto response = map_response(sample_response(), "gpt-4o");

    CHECK(response["id"] == "chatcmpl-01XYZ");
    CHECK(response["object"] == "chat.completion");
    CHECK(response["model"] == "gpt-4o");
    CHECK(response["created"].is_number_integer());
    CHECK(response["system_fingerprint"].is_null());

    REQUIRE(response["choices"].size() == 1);
    const auto& choice = response["choices"][0];
    CHECK(choice["index"] == 0);
    CHECK(choice["logprobs"].is_null());
    CHECK(choice["finish_reason"] == "tool_calls");

    SECTION("thinking dropped by default") {
        CHECK(choice["message"]["role"] == "assistant");
        CHECK(choice["message"]["content"] == "Let me check.");
    }

    SECTION("tool calls carry JSON-string arguments") {
        const auto& calls = choice["message"]["tool_calls"];
        REQUIRE(calls.size() == 1);
        CHECK(calls[0]["id"] == "toolu_1");
        CHECK(calls[0]["type"] == "function");
        CHECK(calls[0]["index"] == 0);
        CHECK(calls[0]["function"]["name"] == "get_weather");
        CHECK(json::parse(calls[0]["function"]["arguments"].get<std::string>()) ==
              json{{"city", "Paris"}});
    }

    SECTION("usage folds cache reads into prompt tokens") {
        CHECK(response["usage"]["prompt_tokens"] == 13);
        CHECK(response["usage"]["completion_tokens"] == 5);
        CHECK(response["usage"]["total_tokens"] == 18);
    }
}

TEST_CASE("map_response includes thinking when asked", "[translate][response]") {
    auto response = map_response(sample_response(), "m", {.include_thinking = true});
    CHECK(response["choices"][0]["message"]["content"] ==
          "<thinking>\nConsider the weather.\n</thinking>\nLet me check.");
}

TEST_CASE("map_response with no text", "[translate][response]") {
    json target = {
        {"content", json::array({
            {{"type", "tool_use"}, {"id", "a"}, {"name", "one"}, {"input", json::object()}},
            {{"type", "tool_use"}, {"id", "b"}, {"name", "two"}, {"input", {{"x", 1}}}},
        })},
        {"stop_reason", "tool_use"},
    };
    auto response = map_response(target, "m");
    const auto& message = response["choices"][0]["message"];

    CHECK(message["content"].is_null());
    REQUIRE(message["tool_calls"].size() == 2);
    CHECK(message["tool_calls"][0]["index"] == 0);
    CHECK(message["tool_calls"][1]["index"] == 1);
    CHECK(message["tool_calls"][0]["function"]["arguments"] == "{}");
}

TEST_CASE("map_response tolerates missing optional fields", "[translate][response]") {
    auto response = map_response(json::object(), "m");

    CHECK(response["id"].get<std::string>().starts_with("chatcmpl-"));
    CHECK(response["choices"][0]["finish_reason"] == "stop");
    CHECK(response["choices"][0]["message"]["content"].is_null());
    CHECK_FALSE(response["choices"][0]["message"].contains("tool_calls"));
    CHECK(response["usage"]["prompt_tokens"] == 0);
    CHECK(response["usage"]["total_tokens"] == 0);
}

TEST_CASE("map_response tolerates null and mistyped block fields", "[translate][response]") {
    json target = {
        {"id", nullptr},
        {"stop_reason", 3},
        {"content", json::array({
            {{"type", nullptr}, {"text", "ignored"}},
            {{"type", "text"}, {"text", nullptr}},
            {{"type", "text"}, {"text", "kept"}},
            {{"type", "thinking"}, {"thinking", nullptr}},
            {{"type", "tool_use"}, {"id", 17}, {"name", nullptr}, {"input", {{"q", 1}}}},
        })},
    };

    json response;
    REQUIRE_NOTHROW(response = map_response(target, "m", {.include_thinking = true}));

    const auto& message = response["choices"][0]["message"];
    CHECK(message["content"] == "\nkept\n<thinking>\n\n</thinking>");
    REQUIRE(message["tool_calls"].size() == 1);
    CHECK(message["tool_calls"][0]["id"] == "");
    CHECK(message["tool_calls"][0]["function"]["name"] == "");
    CHECK(message["tool_calls"][0]["function"]["arguments"] == R"({"q":1})");
    CHECK(response["id"].get<std::string>().starts_with("chatcmpl-"));
    CHECK(response["choices"][0]["finish_reason"] == "stop");
}

TEST_CASE("map_response finish reasons", "[translate][response]") {
    auto reason = [](const char* stop_reason) {
        return map_response({{"stop_reason", stop_reason}}, "m")["choices"][0]["finish_reason"];
    };
    CHECK(reason("end_turn") == "stop");
    CHECK(reason("stop_sequence") == "stop");
    CHECK(reason("max_tokens") == "length");
    CHECK(reason("tool_use") == "tool_calls");
    CHECK(reason("refusal") == "stop");
}

TEST_CASE("map_response joins text blocks with a newline", "[translate][response]") {
    json target = {{"content", json::array({
        {{"type", "text"}, {"text", "one"}},
        {{"type", "text"}, {"text", "two"}},
    })}};
    CHECK(map_response(target, "m")["choices"][0]["message"]["content"] == "one\ntwo");
}

TEST_CASE("make_response_id", "[translate][response]") {
    CHECK(make_response_id("msg_abc") == "chatcmpl-abc");
    CHECK(make_response_id("plain") == "chatcmpl-plain");

    auto random = make_response_id();
    CHECK(random.size() == std::string("chatcmpl-").size() + 24);
    CHECK(random != make_response_id());
}

TEST_CASE("map_usage", "[translate][response]") {
    auto usage = map_usage({{"input_tokens", 7}, {"output_tokens", 2}});
    CHECK(usage.prompt_tokens == 7);
    CHECK(usage.completion_tokens == 2);
    CHECK(usage.total_tokens == 9);

    auto empty = map_usage(nullptr);
    CHECK(empty.total_tokens == 0);
}

TEST_CASE("single text round trip", "[translate][response]") {
    auto request = map_request({
        {"model", "claude-sonnet-4"},
        {"messages", json::array({{{"role", "user"}, {"content", "Say hello"}}})},
    });
    REQUIRE(request.has_value());
    CHECK(request->body["messages"][0]["content"] == "Say hello");

    json target = {
        {"id", "msg_1"},
        {"content", json::array({{{"type", "text"}, {"text", "Hello!"}}})},
        {"stop_reason", "end_turn"},
    };
    auto response = map_response(target, request->body["model"].get<std::string>());
    CHECK(response["choices"][0]["message"]["content"] == "Hello!");
    CHECK(response["model"] == "claude-sonnet-4");
}
