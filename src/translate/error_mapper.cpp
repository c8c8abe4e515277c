#include "chatbridge/translate/error_mapper.hpp"

#include <string>

#include "chatbridge/translate/mapping_tables.hpp"

namespace chatbridge::translate {

namespace {

constexpr auto kDefaultErrorMessage = "An error occurred";

auto make_error_body(std::string message, std::string_view type,
                     std::optional<std::string_view> code) -> json {
    return {
        {"error", {
            {"message", std::move(message)},
            {"type", std::string(type)},
            {"param", nullptr},
            {"code", code ? json(std::string(*code)) : json(nullptr)},
        }},
    };
}

} // anonymous namespace

auto map_error(const json& target_error, int http_status) -> json {
    std::string category = "api_error";
    std::string message = kDefaultErrorMessage;

    // Accept the enveloped form and a bare `{type, message}` error object.
    const json* inner = nullptr;
    if (target_error.is_object() && target_error.contains("error") &&
        target_error["error"].is_object()) {
        inner = &target_error["error"];
    } else if (target_error.is_object() &&
               !(target_error.contains("type") && target_error["type"] == "error")) {
        inner = &target_error;
    }

    if (inner != nullptr) {
        const auto& err = *inner;
        if (err.contains("type") && err["type"].is_string() &&
            !err["type"].get_ref<const std::string&>().empty()) {
            category = err["type"].get<std::string>();
        }
        if (err.contains("message") && err["message"].is_string() &&
            !err["message"].get_ref<const std::string&>().empty()) {
            message = err["message"].get<std::string>();
        }
    }

    return make_error_body(std::move(message), source_error_type(category),
                           source_error_code(http_status));
}

auto map_local_error(const Error& error) -> MappedError {
    switch (error.code()) {
        case ErrorCode::MalformedRequest:
            return {400, make_error_body(error.what(), "invalid_request_error",
                                         source_error_code(400))};
        case ErrorCode::UpstreamError:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::Timeout:
            return {502, make_error_body(error.what(), "api_error", std::nullopt)};
        default:
            return {500, make_error_body(error.what(), "server_error", std::nullopt)};
    }
}

} // namespace chatbridge::translate
