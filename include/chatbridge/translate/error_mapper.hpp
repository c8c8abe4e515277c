#pragma once

#include <nlohmann/json.hpp>

#include "chatbridge/core/error.hpp"

namespace chatbridge::translate {

using json = nlohmann::json;

/// A source-protocol error body with the HTTP status it should be sent with.
struct MappedError {
    int status = 500;
    json body;
};

/// Map a Messages API error object (`{"type":"error","error":{...}}`) and
/// its HTTP status to a Chat Completions error body.
auto map_error(const json& target_error, int http_status) -> json;

/// Map a failure raised inside this library to a Chat Completions error.
auto map_local_error(const Error& error) -> MappedError;

} // namespace chatbridge::translate
