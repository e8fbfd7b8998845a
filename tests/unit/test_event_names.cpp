#include <set>
#include <string_view>
#include <gtest/gtest.h>
#include "protocol/event_names.hpp"
#include "protocol/role_contract.hpp"

namespace events = evo::protocol::events;

TEST(EventNamesTest, AllEventNamesAreDistinct) {
    const std::set<std::string_view> unique(events::kAllEvents.begin(),
                                            events::kAllEvents.end());

    EXPECT_EQ(unique.size(), events::kAllEvents.size());
    EXPECT_EQ(events::kAllEvents.size(), 28u);
}

TEST(EventNamesTest, EventNamesAreNamespacedByParticipant) {
    EXPECT_EQ(events::kAgentRegister, "agent:register");
    EXPECT_EQ(events::kKingConfigUpdate, "king:config_update");
    EXPECT_EQ(events::kPipelineStageResult, "pipeline:stage_result");
    EXPECT_EQ(events::kTaskLog, "task:log");
    for (const auto name : events::kAllEvents) {
        EXPECT_NE(name.find(':'), std::string_view::npos) << name;
    }
}

TEST(EventNamesTest, RoleRoomsUseTheRoleWireName) {
    using evo::protocol::PipelineRole;
    using evo::protocol::UserRole;

    EXPECT_EQ(events::kRoomKernel, "kernel");
    EXPECT_EQ(events::role_room(PipelineRole::Learning), "role:learning");
    EXPECT_EQ(events::role_room(UserRole{"auditor"}), "role:auditor");
    EXPECT_EQ(events::role_room("skill_manage"), "role:skill_manage");
}

TEST(EventNamesTest, TaskRoomsArePrefixedWithTask) {
    EXPECT_EQ(events::task_room("9f1c"), "task:9f1c");
}
