#include "chatbridge/core/config.hpp"
#include "chatbridge/core/logger.hpp"
#include "chatbridge/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace chatbridge {

namespace {

auto env_flag(const char* value) -> bool {
    auto v = utils::to_lower(utils::trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

/// Expand env references in the fields that usually carry secrets or
/// deployment-specific endpoints.
void resolve_backend_refs(BackendConfig& backend) {
    backend.api_key = resolve_env_refs(backend.api_key);
    backend.base_url = resolve_env_refs(backend.base_url);
}

} // anonymous namespace

auto default_reasoning_rules() -> std::vector<ReasoningRule> {
    return {
        ReasoningRule{.pattern = "thinking", .budget_tokens = 10000},
        ReasoningRule{.pattern = "gemini-3", .budget_tokens = 10000},
    };
}

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        resolve_backend_refs(config.backend);

        if (config.default_max_tokens <= 0) {
            LOG_WARN("Config: default_max_tokens must be positive (got {}), using 4096",
                     config.default_max_tokens);
            config.default_max_tokens = 4096;
        }

        std::erase_if(config.reasoning_rules, [](const ReasoningRule& rule) {
            if (rule.pattern.empty()) {
                LOG_WARN("Config: dropping reasoning rule with empty pattern");
                return true;
            }
            return false;
        });

        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("CHATBRIDGE_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("CHATBRIDGE_INCLUDE_THINKING")) {
        config.include_thinking = env_flag(val);
    }
    if (auto* val = std::getenv("CHATBRIDGE_DEFAULT_MODEL")) {
        config.default_model = val;
    }
    if (auto* val = std::getenv("ANTHROPIC_API_KEY")) {
        config.backend.api_key = val;
    }
    if (auto* val = std::getenv("ANTHROPIC_BASE_URL")) {
        config.backend.base_url = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto mapper_options(const Config& config) -> MapperOptions {
    MapperOptions options;
    options.default_max_tokens = config.default_max_tokens;
    options.default_model = config.default_model;
    options.reasoning_rules = config.reasoning_rules;
    return options;
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace chatbridge
