#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"
#include "core/errors/contract_errors.hpp"

namespace evo::config {

    using core::errors::Result;

    struct ServerConfig {
        std::string host;
        std::uint16_t port = 0;
    };

    // How a provider is reached. The last three are driven as local
    // subprocesses instead of HTTP endpoints; only the discriminant lives here.
    enum class ProviderType {
        OpenAiCompatible,
        Anthropic,
        Cursor,
        ClaudeCode,
        CodexCli
    };

    bool is_cli_provider(ProviderType type);

    // Zero in either field is a valid "no traffic" setting.
    struct RateLimitConfig {
        std::uint32_t requests_per_minute = 0;
        std::uint32_t burst_size = 0;
    };

    struct ProviderConfig {
        std::string name;
        std::string base_url;
        // Environment variable names forming a round-robin key pool. Empty for
        // unauthenticated providers.
        std::vector<std::string> api_key_envs;
        bool enabled = false;
        ProviderType provider_type = ProviderType::OpenAiCompatible;
        std::map<std::string, std::string> extra_headers;
        std::optional<RateLimitConfig> rate_limit;
        std::vector<std::string> models;
    };

    struct GatewayConfig {
        ServerConfig server;
        std::vector<ProviderConfig> providers;
    };

    bool operator==(const ServerConfig& lhs, const ServerConfig& rhs);
    bool operator==(const RateLimitConfig& lhs, const RateLimitConfig& rhs);
    bool operator==(const ProviderConfig& lhs, const ProviderConfig& rhs);
    bool operator==(const GatewayConfig& lhs, const GatewayConfig& rhs);

    // Strict TOML decode: unknown keys at any level are rejected and every
    // error carries the offending key's line and column. A provider written
    // with the retired single `api_key_env` key is migrated into
    // `api_key_envs` with a warning.
    Result<GatewayConfig> parse_gateway_config(std::string_view text);

    std::string to_toml(const GatewayConfig& config);

    // Canonical compact JSON. Equal configs give byte-identical text, which
    // is what king:config_update hashes.
    std::string to_json(const GatewayConfig& config);

    // Same rules as parse_gateway_config, over the JSON produced by to_json.
    Result<GatewayConfig> gateway_config_from_json(std::string_view text);

    void to_json(nlohmann::json& j, const ServerConfig& server);
    void to_json(nlohmann::json& j, const RateLimitConfig& rate_limit);
    void to_json(nlohmann::json& j, const ProviderConfig& provider);
    void to_json(nlohmann::json& j, const GatewayConfig& config);

}  // namespace evo::config

namespace evo::core::codec {

template <>
struct EnumNames<config::ProviderType> {
    static constexpr std::array<std::pair<config::ProviderType, std::string_view>, 5>
        entries{{
            {config::ProviderType::OpenAiCompatible, "open_ai_compatible"},
            {config::ProviderType::Anthropic, "anthropic"},
            {config::ProviderType::Cursor, "cursor"},
            {config::ProviderType::ClaudeCode, "claude_code"},
            {config::ProviderType::CodexCli, "codex_cli"},
        }};
};

}  // namespace evo::core::codec
