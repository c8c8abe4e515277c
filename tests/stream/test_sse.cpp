#include <catch2/catch_test_macros.hpp>

#include "chatbridge/stream/sse.hpp"

using namespace chatbridge::stream;

TEST_CASE("encode_data_frame", "[stream][sse]") {
    CHECK(encode_data_frame({{"a", 1}}) == "data: {\"a\":1}\n\n");
    CHECK(kDoneFrame == "data: [DONE]\n\n");
}

TEST_CASE("SseDecoder decodes complete events", "[stream][sse]") {
    auto events = SseDecoder::decode_all(
        "event: message_start\n"
        "data: {\"type\":\"message_start\",\"message\":{\"id\":\"msg_1\"}}\n"
        "\n"
        "event: ping\n"
        "data: {\"type\": \"ping\"}\n"
        "\n");

    REQUIRE(events.size() == 2);
    CHECK(events[0]["type"] == "message_start");
    CHECK(events[0]["message"]["id"] == "msg_1");
    CHECK(events[1]["type"] == "ping");
}

TEST_CASE("SseDecoder handles arbitrary split points", "[stream][sse]") {
    std::string body =
        "event: content_block_delta\r\n"
        "data: {\"type\":\"content_block_delta\",\"index\":0,"
        "\"delta\":{\"type\":\"text_delta\",\"text\":\"Hi\"}}\r\n"
        "\r\n"
        "event: message_stop\r\n"
        "data: {\"type\":\"message_stop\"}\r\n"
        "\r\n";

    SseDecoder decoder;
    std::vector<json> events;
    for (char c : body) {
        for (auto& event : decoder.feed(std::string_view(&c, 1))) {
            events.push_back(std::move(event));
        }
    }
    CHECK(decoder.finish().empty());

    REQUIRE(events.size() == 2);
    CHECK(events[0]["delta"]["text"] == "Hi");
    CHECK(events[1]["type"] == "message_stop");
}

TEST_CASE("SseDecoder edge cases", "[stream][sse]") {
    SECTION("event name fills a missing type") {
        auto events = SseDecoder::decode_all("event: ping\ndata: {}\n\n");
        REQUIRE(events.size() == 1);
        CHECK(events[0]["type"] == "ping");
    }

    SECTION("explicit type wins over the event name") {
        auto events = SseDecoder::decode_all("event: other\ndata: {\"type\":\"ping\"}\n\n");
        REQUIRE(events.size() == 1);
        CHECK(events[0]["type"] == "ping");
    }

    SECTION("comments and unknown fields are skipped") {
        auto events = SseDecoder::decode_all(": keep-alive\nid: 7\nretry: 10\ndata: {\"type\":\"ping\"}\n\n");
        REQUIRE(events.size() == 1);
    }

    SECTION("multi-line data joins with newline") {
        auto events = SseDecoder::decode_all("data: {\"type\":\ndata: \"ping\"}\n\n");
        REQUIRE(events.size() == 1);
        CHECK(events[0]["type"] == "ping");
    }

    SECTION("DONE marker and invalid JSON are skipped") {
        auto events = SseDecoder::decode_all(
            "data: not json\n\n"
            "data: [DONE]\n\n"
            "data: {\"type\":\"message_stop\"}\n\n");
        REQUIRE(events.size() == 1);
        CHECK(events[0]["type"] == "message_stop");
    }

    SECTION("trailing event without blank line is flushed by finish") {
        SseDecoder decoder;
        CHECK(decoder.feed("data: {\"type\":\"message_stop\"}").empty());
        auto tail = decoder.finish();
        REQUIRE(tail.size() == 1);
        CHECK(tail[0]["type"] == "message_stop");
    }

    SECTION("blank lines alone produce nothing") {
        CHECK(SseDecoder::decode_all("\n\n\n").empty());
    }
}
