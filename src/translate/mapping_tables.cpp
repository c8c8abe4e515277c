#include "chatbridge/translate/mapping_tables.hpp"

#include <array>
#include <utility>

#include "chatbridge/core/utils.hpp"

namespace chatbridge::translate {

namespace {

constexpr std::array<std::pair<std::string_view, FinishReason>, 4> kStopReasons = {{
    {"end_turn", FinishReason::Stop},
    {"stop_sequence", FinishReason::Stop},
    {"max_tokens", FinishReason::Length},
    {"tool_use", FinishReason::ToolCalls},
}};

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kErrorTypes = {{
    {"authentication_error", "invalid_api_key"},
    {"invalid_request_error", "invalid_request_error"},
    {"rate_limit_error", "rate_limit_exceeded"},
    {"api_error", "api_error"},
    {"overloaded_error", "server_error"},
    {"permission_error", "insufficient_quota"},
}};

} // anonymous namespace

auto finish_reason_from_stop_reason(std::string_view stop_reason) -> FinishReason {
    for (const auto& [name, reason] : kStopReasons) {
        if (name == stop_reason) return reason;
    }
    return FinishReason::Stop;
}

auto source_error_type(std::string_view target_category) -> std::string_view {
    for (const auto& [target, source] : kErrorTypes) {
        if (target == target_category) return source;
    }
    return "api_error";
}

auto source_error_code(int http_status) -> std::optional<std::string_view> {
    switch (http_status) {
        case 401: return "invalid_api_key";
        case 429: return "rate_limit_exceeded";
        case 400: return "invalid_request_error";
        default: return std::nullopt;
    }
}

auto match_reasoning_rule(std::string_view model,
                          const std::vector<ReasoningRule>& rules)
    -> std::optional<ReasoningRule> {
    for (const auto& rule : rules) {
        if (!rule.pattern.empty() && utils::contains(model, rule.pattern)) {
            return rule;
        }
    }
    return std::nullopt;
}

} // namespace chatbridge::translate
