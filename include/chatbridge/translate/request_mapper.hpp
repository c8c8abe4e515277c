#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatbridge/core/config.hpp"
#include "chatbridge/core/error.hpp"

namespace chatbridge::translate {

using json = nlohmann::json;

/// A target-protocol (Messages API) request built from a source-protocol
/// (Chat Completions) request.
struct MappedRequest {
    json body;
    /// Source fields that were accepted but have no target equivalent.
    std::vector<std::string> ignored_fields;
};

/// Map a Chat Completions request to a Messages API request.
///
/// Fails with ErrorCode::MalformedRequest when `messages` is missing or
/// not an array, when a message is not an object, when a `tool` message
/// has no `tool_call_id`, or when a tool definition has no name.
/// Malformed embedded data (data URIs, tool-call argument JSON) is
/// recovered locally and logged.
auto map_request(const json& source, const MapperOptions& options = {})
    -> Result<MappedRequest>;

/// Text of a message `content` value: the string itself, or the
/// concatenation of the `text` parts of an array. Anything else is "".
auto extract_text(const json& content) -> std::string;

/// Map the `content` of a user message. A single text part collapses to a
/// plain string.
auto map_user_content(const json& content) -> json;

/// Map an assistant message (text and `tool_calls`) to target content.
auto map_assistant_content(const json& message) -> json;

/// Parse the JSON-string form of tool-call arguments. Invalid JSON and
/// non-object values yield `{}`.
auto parse_tool_arguments(const json& arguments) -> json;

/// Map a single source tool definition, function-style or legacy flat.
auto map_tool_definition(const json& tool) -> Result<json>;

/// Map a source `tool_choice` value.
auto map_tool_choice(const json& choice) -> json;

} // namespace chatbridge::translate
