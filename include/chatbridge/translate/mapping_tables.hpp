#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "chatbridge/core/config.hpp"
#include "chatbridge/core/types.hpp"

namespace chatbridge::translate {

inline constexpr std::string_view kSourceIdPrefix = "chatcmpl-";
inline constexpr std::string_view kTargetIdPrefix = "msg_";
inline constexpr std::string_view kChunkObject = "chat.completion.chunk";
inline constexpr std::string_view kCompletionObject = "chat.completion";

/// Target-protocol stop reason -> source-protocol finish reason.
/// end_turn and stop_sequence -> stop, max_tokens -> length,
/// tool_use -> tool_calls; anything else (including empty) -> stop.
auto finish_reason_from_stop_reason(std::string_view stop_reason) -> FinishReason;

/// Target-protocol error category -> source-protocol error type.
/// Unknown categories map to "api_error".
auto source_error_type(std::string_view target_category) -> std::string_view;

/// Machine-readable source-protocol error code derived from the HTTP
/// status alone. Returns nullopt when the status has no code.
auto source_error_code(int http_status) -> std::optional<std::string_view>;

/// First rule whose pattern occurs in `model`, or nullopt.
auto match_reasoning_rule(std::string_view model,
                          const std::vector<ReasoningRule>& rules)
    -> std::optional<ReasoningRule>;

} // namespace chatbridge::translate
