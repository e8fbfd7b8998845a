#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"
#include "core/codec/object_reader.hpp"

namespace evo::protocol {

    // Wire names shared by the canonical roles and the pipeline stages.
    // A pipeline stage is executed by the agent holding the role of the
    // same name, so both enums read their spelling from here.
    namespace pipeline_names {
        inline constexpr std::string_view kSkillManage = "skill_manage";
        inline constexpr std::string_view kLearning = "learning";
        inline constexpr std::string_view kPreLoad = "pre_load";
        inline constexpr std::string_view kBuilding = "building";
        inline constexpr std::string_view kEvaluation = "evaluation";
    }  // namespace pipeline_names

    // The closed set of canonical pipeline roles
    enum class PipelineRole {
        SkillManage,
        Learning,
        PreLoad,
        Building,
        Evaluation
    };

    // Escape hatch for roles outside the pipeline. The name is kept verbatim.
    struct UserRole {
        std::string name;
    };

    inline bool operator==(const UserRole& lhs, const UserRole& rhs) {
        return lhs.name == rhs.name;
    }

    // Encoded as "learning" for canonical roles and {"user": "<name>"} for
    // user roles.
    using AgentRole = std::variant<PipelineRole, UserRole>;

    // One phase of the cyclic pipeline
    // Learning -> Building -> PreLoad -> Evaluation -> SkillManage -> Learning
    enum class PipelineStage {
        Learning,
        Building,
        PreLoad,
        Evaluation,
        SkillManage
    };

    PipelineRole role_for_stage(PipelineStage stage);
    PipelineStage stage_for_role(PipelineRole role);
    PipelineStage next_stage(PipelineStage stage);

    bool is_pipeline_role(const AgentRole& role);

    // "learning" for canonical roles, the verbatim name for user roles.
    std::string role_name(const AgentRole& role);

    // Canonical names map back to PipelineRole, anything else is a UserRole.
    AgentRole role_from_name(std::string_view name);

    nlohmann::json role_to_json(const AgentRole& role);
    AgentRole read_role(core::codec::ObjectReader& reader, const char* key);

}  // namespace evo::protocol

namespace evo::core::codec {

template <>
struct EnumNames<protocol::PipelineRole> {
    static constexpr std::array<std::pair<protocol::PipelineRole, std::string_view>, 5>
        entries{{
            {protocol::PipelineRole::SkillManage, protocol::pipeline_names::kSkillManage},
            {protocol::PipelineRole::Learning, protocol::pipeline_names::kLearning},
            {protocol::PipelineRole::PreLoad, protocol::pipeline_names::kPreLoad},
            {protocol::PipelineRole::Building, protocol::pipeline_names::kBuilding},
            {protocol::PipelineRole::Evaluation, protocol::pipeline_names::kEvaluation},
        }};
};

template <>
struct EnumNames<protocol::PipelineStage> {
    static constexpr std::array<std::pair<protocol::PipelineStage, std::string_view>, 5>
        entries{{
            {protocol::PipelineStage::Learning, protocol::pipeline_names::kLearning},
            {protocol::PipelineStage::Building, protocol::pipeline_names::kBuilding},
            {protocol::PipelineStage::PreLoad, protocol::pipeline_names::kPreLoad},
            {protocol::PipelineStage::Evaluation, protocol::pipeline_names::kEvaluation},
            {protocol::PipelineStage::SkillManage, protocol::pipeline_names::kSkillManage},
        }};
};

}  // namespace evo::core::codec
