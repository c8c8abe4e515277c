#include <catch2/catch_test_macros.hpp>

#include "chatbridge/translate/error_mapper.hpp"

using namespace chatbridge;
using namespace chatbridge::translate;

namespace {

auto envelope(const char* type, const char* message) -> json {
    return {{"type", "error"}, {"error", {{"type", type}, {"message", message}}}};
}

} // anonymous namespace

TEST_CASE("map_error shape", "[translate][error]") {
    auto mapped = map_error(envelope("invalid_request_error", "max_tokens: required"), 400);

    REQUIRE(mapped.contains("error"));
    const auto& err = mapped["error"];
    CHECK(err["message"] == "max_tokens: required");
    CHECK(err["type"] == "invalid_request_error");
    CHECK(err["param"].is_null());
    CHECK(err["code"] == "invalid_request_error");
}

TEST_CASE("map_error category vocabulary", "[translate][error]") {
    auto type_of = [](const char* category) {
        return map_error(envelope(category, "x"), 500)["error"]["type"];
    };
    CHECK(type_of("authentication_error") == "invalid_api_key");
    CHECK(type_of("invalid_request_error") == "invalid_request_error");
    CHECK(type_of("rate_limit_error") == "rate_limit_exceeded");
    CHECK(type_of("api_error") == "api_error");
    CHECK(type_of("overloaded_error") == "server_error");
    CHECK(type_of("permission_error") == "insufficient_quota");
    CHECK(type_of("mystery_error") == "api_error");
}

TEST_CASE("map_error code comes from the status alone", "[translate][error]") {
    SECTION("401") {
        auto mapped = map_error(envelope("overloaded_error", "x"), 401);
        CHECK(mapped["error"]["code"] == "invalid_api_key");
        CHECK(mapped["error"]["type"] == "server_error");
    }

    SECTION("429") {
        CHECK(map_error(envelope("rate_limit_error", "x"), 429)["error"]["code"] ==
              "rate_limit_exceeded");
    }

    SECTION("other statuses have a null code") {
        CHECK(map_error(envelope("api_error", "x"), 500)["error"]["code"].is_null());
        CHECK(map_error(envelope("overloaded_error", "x"), 529)["error"]["code"].is_null());
    }
}

TEST_CASE("map_error defaults", "[translate][error]") {
    SECTION("bare error object") {
        auto mapped = map_error({{"type", "rate_limit_error"}, {"message", "slow down"}}, 429);
        CHECK(mapped["error"]["type"] == "rate_limit_exceeded");
        CHECK(mapped["error"]["message"] == "slow down");
    }

    SECTION("missing message") {
        auto mapped = map_error({{"type", "error"}, {"error", {{"type", "api_error"}}}}, 500);
        CHECK(mapped["error"]["message"] == "An error occurred");
    }

    SECTION("not an object") {
        auto mapped = map_error("boom", 502);
        CHECK(mapped["error"]["type"] == "api_error");
        CHECK(mapped["error"]["message"] == "An error occurred");
    }
}

TEST_CASE("map_local_error", "[translate][error]") {
    SECTION("malformed request is a 400") {
        auto mapped = map_local_error(make_error(ErrorCode::MalformedRequest, "messages missing"));
        CHECK(mapped.status == 400);
        CHECK(mapped.body["error"]["type"] == "invalid_request_error");
        CHECK(mapped.body["error"]["code"] == "invalid_request_error");
        CHECK(mapped.body["error"]["message"] == "messages missing");
    }

    SECTION("transport failures are a 502") {
        auto mapped = map_local_error(make_error(ErrorCode::ConnectionFailed, "refused"));
        CHECK(mapped.status == 502);
        CHECK(mapped.body["error"]["type"] == "api_error");
        CHECK(mapped.body["error"]["code"].is_null());
    }

    SECTION("anything else is a 500") {
        auto mapped = map_local_error(make_error(ErrorCode::IoError, "disk", "full"));
        CHECK(mapped.status == 500);
        CHECK(mapped.body["error"]["type"] == "server_error");
        CHECK(mapped.body["error"]["message"] == "disk: full");
    }
}
