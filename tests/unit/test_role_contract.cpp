#include <set>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"
#include "protocol/role_contract.hpp"

namespace {

using evo::core::codec::EnumNames;
using evo::protocol::AgentRole;
using evo::protocol::PipelineRole;
using evo::protocol::PipelineStage;
using evo::protocol::UserRole;
using nlohmann::json;

template <typename Enum>
std::set<std::string> wire_names() {
    std::set<std::string> names;
    for (const auto& entry : EnumNames<Enum>::entries) {
        names.insert(std::string(entry.second));
    }
    return names;
}

}  // namespace

TEST(RoleContractTest, PipelineRolesAndStagesShareOneNameSet) {
    const auto role_names = wire_names<PipelineRole>();

    EXPECT_EQ(role_names.size(), 5u);
    EXPECT_EQ(role_names, wire_names<PipelineStage>());
}

TEST(RoleContractTest, StageAndRoleMapOntoEachOther) {
    for (const auto& entry : EnumNames<PipelineStage>::entries) {
        const PipelineRole role = evo::protocol::role_for_stage(entry.first);

        EXPECT_EQ(evo::core::codec::enum_name(role), entry.second);
        EXPECT_EQ(evo::protocol::stage_for_role(role), entry.first);
    }
}

TEST(RoleContractTest, NextStageCyclesThroughThePipeline) {
    PipelineStage stage = PipelineStage::Learning;
    stage = evo::protocol::next_stage(stage);
    EXPECT_EQ(stage, PipelineStage::Building);
    stage = evo::protocol::next_stage(stage);
    EXPECT_EQ(stage, PipelineStage::PreLoad);
    stage = evo::protocol::next_stage(stage);
    EXPECT_EQ(stage, PipelineStage::Evaluation);
    stage = evo::protocol::next_stage(stage);
    EXPECT_EQ(stage, PipelineStage::SkillManage);
    stage = evo::protocol::next_stage(stage);
    EXPECT_EQ(stage, PipelineStage::Learning);
}

TEST(RoleContractTest, RoleFromNamePrefersCanonicalRoles) {
    EXPECT_EQ(evo::protocol::role_from_name("pre_load"), AgentRole(PipelineRole::PreLoad));
    EXPECT_EQ(evo::protocol::role_from_name("Reviewer"), AgentRole(UserRole{"Reviewer"}));
    // Canonical names are matched case-sensitively.
    EXPECT_EQ(evo::protocol::role_from_name("Learning"), AgentRole(UserRole{"Learning"}));
}

TEST(RoleContractTest, RoleNameKeepsUserNamesVerbatim) {
    EXPECT_EQ(evo::protocol::role_name(PipelineRole::SkillManage), "skill_manage");
    EXPECT_EQ(evo::protocol::role_name(UserRole{"data scientist"}), "data scientist");
    EXPECT_TRUE(evo::protocol::is_pipeline_role(PipelineRole::Building));
    EXPECT_FALSE(evo::protocol::is_pipeline_role(UserRole{"building"}));
}

TEST(RoleContractTest, RolesEncodeExternallyTagged) {
    EXPECT_EQ(evo::protocol::role_to_json(PipelineRole::Evaluation), json("evaluation"));
    EXPECT_EQ(evo::protocol::role_to_json(UserRole{"alice"}), json({{"user", "alice"}}));
}
