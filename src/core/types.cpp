#include "chatbridge/core/types.hpp"

namespace chatbridge {

auto parse_role(std::string_view role) -> std::optional<Role> {
    if (role == "system") return Role::System;
    if (role == "user") return Role::User;
    if (role == "assistant") return Role::Assistant;
    if (role == "tool") return Role::Tool;
    return std::nullopt;
}

void to_json(json& j, const UsageStats& u) {
    j = json{
        {"prompt_tokens", u.prompt_tokens},
        {"completion_tokens", u.completion_tokens},
        {"total_tokens", u.total_tokens},
    };
}

} // namespace chatbridge
