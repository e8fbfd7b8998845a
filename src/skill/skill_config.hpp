#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"
#include "core/errors/contract_errors.hpp"

namespace evo::skill {

    using core::errors::Result;

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Delete,
        Patch
    };

    struct SkillEndpoint {
        std::string name;
        std::string url;
        HttpMethod method = HttpMethod::Get;
        std::map<std::string, std::string> headers;
    };

    // Contents of a skill's config.toml
    struct SkillConfig {
        std::vector<SkillEndpoint> endpoints;
        std::optional<std::string> auth_ref;  // environment variable holding the credential
        // Skill-specific settings. Taken as written, nested tables included;
        // no key checks apply below this point.
        nlohmann::json extra = nlohmann::json::object();
    };

    bool operator==(const SkillEndpoint& lhs, const SkillEndpoint& rhs);
    bool operator==(const SkillConfig& lhs, const SkillConfig& rhs);

    Result<SkillConfig> parse_skill_config(std::string_view text);
    std::string to_toml(const SkillConfig& config);

    void to_json(nlohmann::json& j, const SkillEndpoint& endpoint);
    void to_json(nlohmann::json& j, const SkillConfig& config);

}  // namespace evo::skill

namespace evo::core::codec {

template <>
struct EnumNames<skill::HttpMethod> {
    static constexpr std::array<std::pair<skill::HttpMethod, std::string_view>, 5>
        entries{{
            {skill::HttpMethod::Get, "GET"},
            {skill::HttpMethod::Post, "POST"},
            {skill::HttpMethod::Put, "PUT"},
            {skill::HttpMethod::Delete, "DELETE"},
            {skill::HttpMethod::Patch, "PATCH"},
        }};
};

}  // namespace evo::core::codec
