#include "skill/skill_config.hpp"

#include "core/codec/document_decoder.hpp"
#include "core/codec/json_values.hpp"
#include "core/codec/object_reader.hpp"
#include "core/codec/toml_document.hpp"

namespace evo::skill {

using core::codec::ObjectReader;
using nlohmann::json;

namespace {

SkillEndpoint read_endpoint(ObjectReader reader) {
    SkillEndpoint endpoint;
    endpoint.name = reader.required_string("name");
    endpoint.url = reader.required_string("url");
    endpoint.method = reader.required_enum<HttpMethod>("method");
    endpoint.headers = reader.string_map_or_empty("headers");
    reader.finish();
    return endpoint;
}

SkillConfig read_skill_config(ObjectReader& reader) {
    SkillConfig config;
    for (auto& entry : reader.object_list_or_empty("endpoints")) {
        config.endpoints.push_back(read_endpoint(std::move(entry)));
    }
    config.auth_ref = reader.optional_string("auth_ref");
    config.extra = reader.object_value_or_empty("extra");
    return config;
}

}  // namespace

bool operator==(const SkillEndpoint& lhs, const SkillEndpoint& rhs) {
    return lhs.name == rhs.name && lhs.url == rhs.url && lhs.method == rhs.method &&
           lhs.headers == rhs.headers;
}

bool operator==(const SkillConfig& lhs, const SkillConfig& rhs) {
    return lhs.endpoints == rhs.endpoints && lhs.auth_ref == rhs.auth_ref &&
           lhs.extra == rhs.extra;
}

void to_json(json& j, const SkillEndpoint& endpoint) {
    j = json::object();
    j["name"] = endpoint.name;
    j["url"] = endpoint.url;
    j["method"] = core::codec::enum_to_json(endpoint.method);
    j["headers"] = endpoint.headers;
}

void to_json(json& j, const SkillConfig& config) {
    j = json::object();
    j["endpoints"] = config.endpoints;
    j["auth_ref"] = core::codec::optional_to_json(config.auth_ref);
    j["extra"] = config.extra;
}

Result<SkillConfig> parse_skill_config(const std::string_view text) {
    return core::codec::decode_toml_document<SkillConfig>(text, read_skill_config);
}

std::string to_toml(const SkillConfig& config) {
    return core::codec::write_toml(json(config));
}

}  // namespace evo::skill
