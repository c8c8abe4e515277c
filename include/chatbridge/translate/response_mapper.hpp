#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chatbridge/core/types.hpp"

namespace chatbridge::translate {

using json = nlohmann::json;

struct ResponseOptions {
    /// Render thinking blocks as `<thinking>` text instead of dropping them.
    bool include_thinking = false;
};

/// Map a complete Messages API response to a Chat Completions response.
/// Never fails; missing optional fields default to empty or zero.
auto map_response(const json& target, std::string_view model,
                  const ResponseOptions& options = {}) -> json;

/// Source-protocol usage from a target-protocol `usage` object. Cache-read
/// input tokens are folded into the prompt count.
auto map_usage(const json& usage) -> UsageStats;

/// `chatcmpl-` id derived from a backend message id, or a random one when
/// the backend supplied none.
auto make_response_id(std::string_view backend_id = {}) -> std::string;

} // namespace chatbridge::translate
