#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/contract_errors.hpp"

namespace evo::skill {

    using core::errors::Result;

    // One named input or output. `type` is a free-form tag; checking real
    // data against it happens wherever the skill is invoked.
    struct SkillIO {
        std::string name;
        std::string type;
        bool required = false;
        std::optional<std::string> description;
    };

    // Contents of a skill's manifest.toml
    struct SkillManifest {
        std::string name;
        std::string version;
        std::string description;
        std::vector<std::string> capabilities;
        std::vector<SkillIO> inputs;
        std::vector<SkillIO> outputs;
        // Other skills by name. Resolving them, cycles included, is the
        // loader's job.
        std::vector<std::string> dependencies;
        bool has_code = false;
    };

    bool operator==(const SkillIO& lhs, const SkillIO& rhs);
    bool operator==(const SkillManifest& lhs, const SkillManifest& rhs);

    Result<SkillManifest> parse_skill_manifest(std::string_view text);
    std::string to_toml(const SkillManifest& manifest);

    void to_json(nlohmann::json& j, const SkillIO& io);
    void to_json(nlohmann::json& j, const SkillManifest& manifest);

}  // namespace evo::skill
