#include <catch2/catch_test_macros.hpp>

#include "chatbridge/translate/tool_result_buffer.hpp"

using chatbridge::translate::ToolResultBuffer;
using json = nlohmann::json;

TEST_CASE("ToolResultBuffer starts idle", "[translate][tool_results]") {
    ToolResultBuffer buffer;
    CHECK(buffer.state() == ToolResultBuffer::State::Idle);
    CHECK(buffer.size() == 0);
    CHECK_FALSE(buffer.flush().has_value());
}

TEST_CASE("ToolResultBuffer accumulates and flushes", "[translate][tool_results]") {
    ToolResultBuffer buffer;
    buffer.add("call_1", "first");
    buffer.add("call_2", "second");

    CHECK(buffer.state() == ToolResultBuffer::State::Accumulating);
    CHECK(buffer.size() == 2);

    auto message = buffer.flush();
    REQUIRE(message.has_value());
    CHECK((*message)["role"] == "user");
    REQUIRE((*message)["content"].size() == 2);
    CHECK((*message)["content"][0] == json{
        {"type", "tool_result"}, {"tool_use_id", "call_1"}, {"content", "first"}});
    CHECK((*message)["content"][1]["tool_use_id"] == "call_2");

    SECTION("flush resets to idle") {
        CHECK(buffer.state() == ToolResultBuffer::State::Idle);
        CHECK(buffer.size() == 0);
        CHECK_FALSE(buffer.flush().has_value());
    }

    SECTION("buffer is reusable after a flush") {
        buffer.add("call_3", "third");
        auto next = buffer.flush();
        REQUIRE(next.has_value());
        REQUIRE((*next)["content"].size() == 1);
        CHECK((*next)["content"][0]["tool_use_id"] == "call_3");
    }
}

TEST_CASE("ToolResultBuffer accepts empty content", "[translate][tool_results]") {
    ToolResultBuffer buffer;
    buffer.add("call_1", "");
    auto message = buffer.flush();
    REQUIRE(message.has_value());
    CHECK((*message)["content"][0]["content"] == "");
}
