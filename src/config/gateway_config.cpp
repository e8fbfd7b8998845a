#include "config/gateway_config.hpp"

#include <limits>
#include "core/codec/document_decoder.hpp"
#include "core/codec/json_values.hpp"
#include "core/codec/object_reader.hpp"
#include "core/codec/toml_document.hpp"
#include "core/logging/logger.hpp"

namespace evo::config {

using core::codec::enum_to_json;
using core::codec::ObjectReader;
using nlohmann::json;

namespace {

constexpr const char* kLegacyApiKeyEnv = "api_key_env";
constexpr std::uint64_t kU32Max = std::numeric_limits<std::uint32_t>::max();

ServerConfig read_server(ObjectReader reader) {
    ServerConfig server;
    server.host = reader.required_string("host");
    server.port = static_cast<std::uint16_t>(
        reader.required_unsigned("port", std::numeric_limits<std::uint16_t>::max()));
    reader.finish();
    return server;
}

RateLimitConfig read_rate_limit(ObjectReader reader) {
    RateLimitConfig rate_limit;
    rate_limit.requests_per_minute =
        static_cast<std::uint32_t>(reader.required_unsigned("requests_per_minute", kU32Max));
    rate_limit.burst_size =
        static_cast<std::uint32_t>(reader.required_unsigned("burst_size", kU32Max));
    reader.finish();
    return rate_limit;
}

std::vector<std::string> read_api_key_envs(ObjectReader& reader,
                                           const std::string& provider_name) {
    const json* legacy = reader.find(kLegacyApiKeyEnv);
    if (legacy == nullptr) {
        return reader.string_list_or_empty("api_key_envs");
    }
    if (reader.find("api_key_envs") != nullptr) {
        reader.fail(kLegacyApiKeyEnv, "conflicting_keys",
                    "`api_key_env` and `api_key_envs` cannot both be set; "
                    "move the key into `api_key_envs`");
    }
    if (!legacy->is_string()) {
        reader.fail_type(kLegacyApiKeyEnv, "string", *legacy);
    }
    EVO_LOG_WARN("provider `" + provider_name +
                 "` uses deprecated `api_key_env`; migrated to `api_key_envs`");
    return {legacy->get<std::string>()};
}

ProviderConfig read_provider(ObjectReader reader) {
    ProviderConfig provider;
    provider.name = reader.required_string("name");
    provider.base_url = reader.required_string("base_url");
    provider.api_key_envs = read_api_key_envs(reader, provider.name);
    provider.enabled = reader.required_bool("enabled");
    provider.provider_type =
        reader.enum_or<ProviderType>("provider_type", ProviderType::OpenAiCompatible);
    provider.extra_headers = reader.string_map_or_empty("extra_headers");
    if (auto rate_limit = reader.optional_object("rate_limit")) {
        provider.rate_limit = read_rate_limit(std::move(*rate_limit));
    }
    provider.models = reader.string_list_or_empty("models");
    reader.finish();
    return provider;
}

GatewayConfig read_gateway(ObjectReader& reader) {
    GatewayConfig config;
    config.server = read_server(reader.required_object("server"));
    for (auto& entry : reader.object_list_or_empty("providers")) {
        config.providers.push_back(read_provider(std::move(entry)));
    }
    return config;
}

}  // namespace

bool is_cli_provider(const ProviderType type) {
    switch (type) {
        case ProviderType::Cursor:
        case ProviderType::ClaudeCode:
        case ProviderType::CodexCli:
            return true;
        case ProviderType::OpenAiCompatible:
        case ProviderType::Anthropic:
            return false;
    }
    return false;
}

bool operator==(const ServerConfig& lhs, const ServerConfig& rhs) {
    return lhs.host == rhs.host && lhs.port == rhs.port;
}

bool operator==(const RateLimitConfig& lhs, const RateLimitConfig& rhs) {
    return lhs.requests_per_minute == rhs.requests_per_minute &&
           lhs.burst_size == rhs.burst_size;
}

bool operator==(const ProviderConfig& lhs, const ProviderConfig& rhs) {
    return lhs.name == rhs.name && lhs.base_url == rhs.base_url &&
           lhs.api_key_envs == rhs.api_key_envs && lhs.enabled == rhs.enabled &&
           lhs.provider_type == rhs.provider_type &&
           lhs.extra_headers == rhs.extra_headers &&
           lhs.rate_limit == rhs.rate_limit && lhs.models == rhs.models;
}

bool operator==(const GatewayConfig& lhs, const GatewayConfig& rhs) {
    return lhs.server == rhs.server && lhs.providers == rhs.providers;
}

void to_json(json& j, const ServerConfig& server) {
    j = json::object();
    j["host"] = server.host;
    j["port"] = server.port;
}

void to_json(json& j, const RateLimitConfig& rate_limit) {
    j = json::object();
    j["requests_per_minute"] = rate_limit.requests_per_minute;
    j["burst_size"] = rate_limit.burst_size;
}

void to_json(json& j, const ProviderConfig& provider) {
    j = json::object();
    j["name"] = provider.name;
    j["base_url"] = provider.base_url;
    j["api_key_envs"] = provider.api_key_envs;
    j["enabled"] = provider.enabled;
    j["provider_type"] = enum_to_json(provider.provider_type);
    j["extra_headers"] = provider.extra_headers;
    j["rate_limit"] = core::codec::optional_to_json(provider.rate_limit);
    j["models"] = provider.models;
}

void to_json(json& j, const GatewayConfig& config) {
    j = json::object();
    j["server"] = config.server;
    j["providers"] = config.providers;
}

Result<GatewayConfig> parse_gateway_config(const std::string_view text) {
    return core::codec::decode_toml_document<GatewayConfig>(text, read_gateway);
}

std::string to_toml(const GatewayConfig& config) {
    return core::codec::write_toml(json(config));
}

std::string to_json(const GatewayConfig& config) {
    return json(config).dump();
}

Result<GatewayConfig> gateway_config_from_json(const std::string_view text) {
    return core::codec::decode_json_document<GatewayConfig>(text, read_gateway);
}

}  // namespace evo::config
