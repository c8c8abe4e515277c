#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatbridge {

using json = nlohmann::json;

enum class Role {
    System,
    User,
    Assistant,
    Tool,
};

/// Parse a source-protocol role string. Returns nullopt for roles this
/// bridge does not know.
auto parse_role(std::string_view role) -> std::optional<Role>;

/// Terminal classification of a source-protocol choice.
enum class FinishReason {
    Stop,
    Length,
    ToolCalls,
    Other,
};

NLOHMANN_JSON_SERIALIZE_ENUM(FinishReason, {
    {FinishReason::Stop, "stop"},
    {FinishReason::Length, "length"},
    {FinishReason::ToolCalls, "tool_calls"},
    {FinishReason::Other, "other"},
})

/// Kind of the target-protocol content block currently open in a stream.
enum class BlockKind {
    None,
    Text,
    Thinking,
    Tool,
};

/// Token accounting in source-protocol terms. `total_tokens` is always
/// the sum of the other two.
struct UsageStats {
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t total_tokens = 0;
};

void to_json(json& j, const UsageStats& u);

} // namespace chatbridge
