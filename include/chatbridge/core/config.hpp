#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatbridge/core/types.hpp"

// std::optional serializer for nlohmann/json, so the NLOHMANN_DEFINE
// macros accept optional members.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace chatbridge {

/// Model-name substring that switches on extended reasoning with the
/// given token budget.
struct ReasoningRule {
    std::string pattern;
    int budget_tokens = 10000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ReasoningRule, pattern, budget_tokens)

auto default_reasoning_rules() -> std::vector<ReasoningRule>;

struct BackendConfig {
    std::string base_url = "https://api.anthropic.com";
    std::string api_key;
    std::string api_version = "2023-06-01";
    int timeout_seconds = 120;
    bool verify_ssl = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BackendConfig, base_url, api_key, api_version, timeout_seconds, verify_ssl)

struct Config {
    std::string log_level = "info";
    bool include_thinking = false;
    int default_max_tokens = 4096;
    std::optional<std::string> default_model;
    std::vector<ReasoningRule> reasoning_rules = default_reasoning_rules();
    BackendConfig backend;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, include_thinking, default_max_tokens, default_model, reasoning_rules, backend)

/// Per-call knobs of the request mapper.
struct MapperOptions {
    int default_max_tokens = 4096;
    std::optional<std::string> default_model;
    std::vector<ReasoningRule> reasoning_rules = default_reasoning_rules();
};

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;
auto mapper_options(const Config& config) -> MapperOptions;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace chatbridge
