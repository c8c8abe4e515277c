#include "chatbridge/translate/request_mapper.hpp"

#include <optional>
#include <string_view>
#include <utility>

#include "chatbridge/core/logger.hpp"
#include "chatbridge/core/types.hpp"
#include "chatbridge/translate/mapping_tables.hpp"
#include "chatbridge/translate/tool_result_buffer.hpp"

namespace chatbridge::translate {

namespace {

constexpr std::string_view kDataUriScheme = "data:";
constexpr std::string_view kBase64Marker = ";base64,";

/// Loose truthiness used for optional request knobs: null, false, 0 and
/// "" all count as absent.
auto is_truthy(const json& j) -> bool {
    if (j.is_null()) return false;
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number()) return j.get<double>() != 0.0;
    if (j.is_string()) return !j.get_ref<const std::string&>().empty();
    return true;
}

auto field_truthy(const json& obj, const char* key) -> bool {
    return obj.contains(key) && is_truthy(obj[key]);
}

auto positive_int_field(const json& obj, const char* key) -> std::optional<int64_t> {
    if (!obj.contains(key)) return std::nullopt;
    const auto& v = obj[key];
    if (v.is_number_integer() && v.get<int64_t>() > 0) return v.get<int64_t>();
    if (v.is_number_float() && v.get<double>() >= 1.0) {
        return static_cast<int64_t>(v.get<double>());
    }
    return std::nullopt;
}

auto string_field(const json& obj, const char* key) -> std::string {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return {};
}

/// Split `data:<media-type>;base64,<payload>` into its two parts.
auto parse_data_uri(std::string_view uri)
    -> std::optional<std::pair<std::string, std::string>> {
    if (!uri.starts_with(kDataUriScheme)) return std::nullopt;

    auto semi = uri.find(';', kDataUriScheme.size());
    if (semi == std::string_view::npos || semi == kDataUriScheme.size()) {
        return std::nullopt;
    }
    if (uri.compare(semi, kBase64Marker.size(), kBase64Marker) != 0) {
        return std::nullopt;
    }

    auto payload = uri.substr(semi + kBase64Marker.size());
    if (payload.empty() || payload.find_first_of("\r\n") != std::string_view::npos) {
        return std::nullopt;
    }

    return std::make_pair(
        std::string(uri.substr(kDataUriScheme.size(), semi - kDataUriScheme.size())),
        std::string(payload));
}

auto map_image_part(const json& part) -> std::optional<json> {
    const json* ref = part.contains("image_url") ? &part["image_url"] : nullptr;
    std::string url;
    if (ref != nullptr && ref->is_object()) {
        url = string_field(*ref, "url");
    } else if (ref != nullptr && ref->is_string()) {
        url = ref->get<std::string>();
    }

    if (url.empty()) {
        LOG_WARN("Dropping image part without a url");
        return std::nullopt;
    }

    if (url.starts_with(kDataUriScheme)) {
        auto parsed = parse_data_uri(url);
        if (!parsed) {
            LOG_WARN("Dropping image part with malformed data URI");
            return std::nullopt;
        }
        return json{
            {"type", "image"},
            {"source", {
                {"type", "base64"},
                {"media_type", std::move(parsed->first)},
                {"data", std::move(parsed->second)},
            }},
        };
    }

    return json{
        {"type", "image"},
        {"source", {
            {"type", "url"},
            {"url", std::move(url)},
        }},
    };
}

/// One text part collapses to a plain string; otherwise the part list.
auto collapse_parts(json parts) -> json {
    if (parts.size() == 1 && string_field(parts[0], "type") == "text") {
        return parts[0]["text"];
    }
    return parts;
}

} // anonymous namespace

auto extract_text(const json& content) -> std::string {
    if (content.is_string()) return content.get<std::string>();
    if (!content.is_array()) return {};

    std::string text;
    for (const auto& part : content) {
        if (part.is_object() && string_field(part, "type") == "text") {
            text += string_field(part, "text");
        }
    }
    return text;
}

auto map_user_content(const json& content) -> json {
    if (content.is_string()) return content;
    if (content.is_null()) return "";
    if (!content.is_array()) return content.dump();

    json parts = json::array();
    for (const auto& part : content) {
        if (!part.is_object()) continue;
        auto type = string_field(part, "type");
        if (type == "text") {
            parts.push_back({{"type", "text"}, {"text", string_field(part, "text")}});
        } else if (type == "image_url") {
            if (auto image = map_image_part(part)) {
                parts.push_back(std::move(*image));
            }
        } else {
            LOG_DEBUG("Dropping unsupported user content part type '{}'", type);
        }
    }
    return collapse_parts(std::move(parts));
}

auto parse_tool_arguments(const json& arguments) -> json {
    if (arguments.is_object()) return arguments;
    if (arguments.is_null()) return json::object();
    if (!arguments.is_string()) {
        LOG_WARN("Tool call arguments are neither a string nor an object, using {{}}");
        return json::object();
    }

    const auto& text = arguments.get_ref<const std::string&>();
    if (text.empty()) return json::object();

    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        LOG_WARN("Failed to parse tool call arguments, using {{}}: {}", text);
        return json::object();
    }
    if (!parsed.is_object()) {
        LOG_WARN("Tool call arguments are not a JSON object, using {{}}: {}", text);
        return json::object();
    }
    return parsed;
}

auto map_assistant_content(const json& message) -> json {
    json parts = json::array();

    if (message.contains("content") && is_truthy(message["content"])) {
        auto text = extract_text(message["content"]);
        if (!text.empty()) {
            parts.push_back({{"type", "text"}, {"text", std::move(text)}});
        }
    }

    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& call : message["tool_calls"]) {
            if (!call.is_object()) continue;
            auto type = string_field(call, "type");
            if (type.empty()) type = "function";
            if (type != "function") {
                LOG_DEBUG("Dropping assistant tool call of type '{}'", type);
                continue;
            }

            const json fn = call.contains("function") && call["function"].is_object()
                ? call["function"] : json::object();
            parts.push_back({
                {"type", "tool_use"},
                {"id", string_field(call, "id")},
                {"name", string_field(fn, "name")},
                {"input", parse_tool_arguments(fn.contains("arguments") ? fn["arguments"] : json())},
            });
        }
    }

    if (parts.empty()) return "";
    return collapse_parts(std::move(parts));
}

auto map_tool_definition(const json& tool) -> Result<json> {
    if (!tool.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::MalformedRequest, "Tool definition must be an object"));
    }

    const json fn = tool.contains("function") && tool["function"].is_object()
        ? tool["function"] : json::object();

    json mapped;
    if (string_field(tool, "type") == "function") {
        mapped["name"] = string_field(fn, "name");
        mapped["description"] = string_field(fn, "description");
        mapped["input_schema"] = fn.contains("parameters") && fn["parameters"].is_object()
            ? fn["parameters"] : json{{"type", "object"}};
    } else {
        // Legacy flat shape: name/description/parameters on the tool itself.
        auto name = string_field(tool, "name");
        mapped["name"] = name.empty() ? string_field(fn, "name") : name;
        auto description = string_field(tool, "description");
        mapped["description"] = description.empty() ? string_field(fn, "description") : description;
        if (tool.contains("parameters") && tool["parameters"].is_object()) {
            mapped["input_schema"] = tool["parameters"];
        } else if (fn.contains("parameters") && fn["parameters"].is_object()) {
            mapped["input_schema"] = fn["parameters"];
        } else {
            mapped["input_schema"] = json{{"type", "object"}};
        }
    }

    if (mapped["name"].get_ref<const std::string&>().empty()) {
        return std::unexpected(make_error(
            ErrorCode::MalformedRequest, "Tool definition has no name"));
    }
    return mapped;
}

auto map_tool_choice(const json& choice) -> json {
    if (choice.is_string()) {
        const auto& value = choice.get_ref<const std::string&>();
        if (value == "auto") return {{"type", "auto"}};
        if (value == "none") return {{"type", "none"}};
        if (value == "required") return {{"type", "any"}};
    }

    if (choice.is_object() && string_field(choice, "type") == "function" &&
        choice.contains("function") && choice["function"].is_object()) {
        auto name = string_field(choice["function"], "name");
        if (!name.empty()) {
            return {{"type", "tool"}, {"name", std::move(name)}};
        }
    }

    return {{"type", "auto"}};
}

auto map_request(const json& source, const MapperOptions& options)
    -> Result<MappedRequest> {
    if (!source.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::MalformedRequest, "Request body must be a JSON object"));
    }
    if (!source.contains("messages") || !source["messages"].is_array()) {
        return std::unexpected(make_error(
            ErrorCode::MalformedRequest, "'messages' is required and must be an array"));
    }

    const auto& messages = source["messages"];
    std::string system;
    bool has_system = false;
    json mapped_messages = json::array();
    ToolResultBuffer tool_results;

    auto flush_tool_results = [&]() {
        if (auto merged = tool_results.flush()) {
            mapped_messages.push_back(std::move(*merged));
        }
    };

    for (std::size_t i = 0; i < messages.size(); ++i) {
        const auto& msg = messages[i];
        if (!msg.is_object()) {
            return std::unexpected(make_error(
                ErrorCode::MalformedRequest,
                "Each message must be an object",
                "messages[" + std::to_string(i) + "]"));
        }

        auto role_name = string_field(msg, "role");
        auto role = parse_role(role_name);
        const json content = msg.contains("content") ? msg["content"] : json();

        if (role == Role::System) {
            if (has_system) system += "\n\n";
            system += extract_text(content);
            has_system = true;
            continue;
        }

        if (role == Role::Tool) {
            if (!msg.contains("tool_call_id") || !msg["tool_call_id"].is_string()) {
                return std::unexpected(make_error(
                    ErrorCode::MalformedRequest,
                    "Tool message is missing 'tool_call_id'",
                    "messages[" + std::to_string(i) + "]"));
            }
            tool_results.add(msg["tool_call_id"].get<std::string>(), extract_text(content));
            continue;
        }

        flush_tool_results();

        if (role == Role::User) {
            mapped_messages.push_back({{"role", "user"}, {"content", map_user_content(content)}});
        } else if (role == Role::Assistant) {
            mapped_messages.push_back({{"role", "assistant"}, {"content", map_assistant_content(msg)}});
        } else {
            LOG_WARN("Dropping message with unsupported role '{}'", role_name);
        }
    }
    flush_tool_results();

    MappedRequest result;
    auto& body = result.body;

    auto model = string_field(source, "model");
    if (model.empty() && options.default_model) {
        model = *options.default_model;
    }
    if (!model.empty()) {
        body["model"] = model;
    } else {
        LOG_WARN("Request has no model and no default model is configured");
    }

    body["messages"] = std::move(mapped_messages);

    if (auto n = positive_int_field(source, "max_completion_tokens")) {
        body["max_tokens"] = *n;
    } else if (auto m = positive_int_field(source, "max_tokens")) {
        body["max_tokens"] = *m;
    } else {
        body["max_tokens"] = options.default_max_tokens;
    }

    body["stream"] = source.contains("stream") && source["stream"].is_boolean() &&
                     source["stream"].get<bool>();

    if (!system.empty()) {
        body["system"] = system;
    }

    if (source.contains("temperature") && source["temperature"].is_number()) {
        body["temperature"] = source["temperature"];
    }
    if (source.contains("top_p") && source["top_p"].is_number()) {
        body["top_p"] = source["top_p"];
    }

    if (source.contains("stop")) {
        const auto& stop = source["stop"];
        json sequences = json::array();
        if (stop.is_string() && !stop.get_ref<const std::string&>().empty()) {
            sequences.push_back(stop);
        } else if (stop.is_array()) {
            for (const auto& s : stop) {
                if (s.is_string()) sequences.push_back(s);
            }
        }
        if (!sequences.empty()) {
            body["stop_sequences"] = std::move(sequences);
        }
    }

    if (source.contains("tools") && source["tools"].is_array() && !source["tools"].empty()) {
        json tools = json::array();
        for (const auto& tool : source["tools"]) {
            auto mapped = map_tool_definition(tool);
            if (!mapped) {
                return std::unexpected(mapped.error());
            }
            tools.push_back(std::move(*mapped));
        }
        body["tools"] = std::move(tools);
    }

    if (source.contains("tool_choice") && !source["tool_choice"].is_null()) {
        body["tool_choice"] = map_tool_choice(source["tool_choice"]);
    }

    if (auto rule = match_reasoning_rule(model, options.reasoning_rules)) {
        body["thinking"] = {
            {"type", "enabled"},
            {"budget_tokens", rule->budget_tokens},
        };
        LOG_DEBUG("Enabled extended reasoning for model '{}' (pattern '{}', budget {})",
                  model, rule->pattern, rule->budget_tokens);
    }

    auto ignore = [&result](std::string field, std::string_view why) {
        LOG_DEBUG("Ignoring unsupported field '{}': {}", field, why);
        result.ignored_fields.push_back(std::move(field));
    };

    if (field_truthy(source, "logprobs") || field_truthy(source, "top_logprobs")) {
        ignore("logprobs", "log-probabilities are not supported");
    }
    if (source.contains("n") && source["n"].is_number() && source["n"].get<double>() > 1) {
        ignore("n", "multiple candidates are not supported, using n=1");
    }
    if (field_truthy(source, "response_format")) {
        ignore("response_format", "response format constraints are not supported");
    }
    if (field_truthy(source, "frequency_penalty") || field_truthy(source, "presence_penalty")) {
        ignore("frequency_penalty/presence_penalty", "penalties are not supported");
    }

    return result;
}

} // namespace chatbridge::translate
