#include "chatbridge/translate/response_mapper.hpp"

#include <vector>

#include "chatbridge/core/logger.hpp"
#include "chatbridge/core/utils.hpp"
#include "chatbridge/translate/mapping_tables.hpp"

namespace chatbridge::translate {

namespace {

auto token_count(const json& usage, const char* key) -> int64_t {
    if (usage.contains(key) && usage[key].is_number()) {
        return usage[key].get<int64_t>();
    }
    return 0;
}

/// String member of `obj`, or empty when missing or not a string.
auto string_field(const json& obj, const char* key) -> std::string {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // anonymous namespace

auto map_usage(const json& usage) -> UsageStats {
    UsageStats stats;
    if (!usage.is_object()) return stats;

    stats.prompt_tokens = token_count(usage, "input_tokens") +
                          token_count(usage, "cache_read_input_tokens");
    stats.completion_tokens = token_count(usage, "output_tokens");
    stats.total_tokens = stats.prompt_tokens + stats.completion_tokens;
    return stats;
}

auto make_response_id(std::string_view backend_id) -> std::string {
    if (backend_id.empty()) {
        return std::string(kSourceIdPrefix) + utils::random_hex(12);
    }
    if (backend_id.starts_with(kTargetIdPrefix)) {
        backend_id.remove_prefix(kTargetIdPrefix.size());
    }
    return std::string(kSourceIdPrefix) + std::string(backend_id);
}

auto map_response(const json& target, std::string_view model,
                  const ResponseOptions& options) -> json {
    std::vector<std::string> text_parts;
    json tool_calls = json::array();

    if (target.contains("content") && target["content"].is_array()) {
        for (const auto& block : target["content"]) {
            if (!block.is_object()) continue;
            auto type = string_field(block, "type");

            if (type == "text") {
                text_parts.push_back(string_field(block, "text"));
            } else if (type == "thinking") {
                if (options.include_thinking) {
                    text_parts.push_back("<thinking>\n" + string_field(block, "thinking") +
                                         "\n</thinking>");
                }
            } else if (type == "tool_use") {
                const json input = block.contains("input") && !block["input"].is_null()
                    ? block["input"] : json::object();
                tool_calls.push_back({
                    {"id", string_field(block, "id")},
                    {"type", "function"},
                    {"function", {
                        {"name", string_field(block, "name")},
                        {"arguments", input.dump()},
                    }},
                    {"index", tool_calls.size()},
                });
            } else {
                LOG_DEBUG("Skipping content block of type '{}'", type);
            }
        }
    }

    json message = {{"role", "assistant"}};
    message["content"] = text_parts.empty() ? json(nullptr) : json(join(text_parts, "\n"));
    if (!tool_calls.empty()) {
        message["tool_calls"] = std::move(tool_calls);
    }

    auto stop_reason = string_field(target, "stop_reason");
    auto backend_id = string_field(target, "id");

    return {
        {"id", make_response_id(backend_id)},
        {"object", std::string(kCompletionObject)},
        {"created", utils::unix_timestamp()},
        {"model", std::string(model)},
        {"choices", json::array({
            {
                {"index", 0},
                {"message", std::move(message)},
                {"logprobs", nullptr},
                {"finish_reason", finish_reason_from_stop_reason(stop_reason)},
            },
        })},
        {"usage", map_usage(target.contains("usage") ? target["usage"] : json())},
        {"system_fingerprint", nullptr},
    };
}

} // namespace chatbridge::translate
