#include <gtest/gtest.h>
#include "config/agent_config.hpp"

namespace {

using evo::config::AgentConfig;
using evo::config::parse_agent_config;
using evo::core::errors::get_error;
using evo::core::errors::get_value;
using evo::core::errors::is_error;

}  // namespace

TEST(AgentConfigTest, ParsesRoleSkillsAndKing) {
    auto result = parse_agent_config(R"(
role = "learning"
skills = ["web-search", "summarize"]
king_address = "ws://king:3000"
)");

    ASSERT_FALSE(is_error(result)) << get_error(result).describe();
    const auto& config = get_value(result);
    EXPECT_EQ(config.role, "learning");
    ASSERT_EQ(config.skills.size(), 2u);
    EXPECT_EQ(config.skills[1], "summarize");
    EXPECT_EQ(config.king_address, "ws://king:3000");
}

TEST(AgentConfigTest, SkillsDefaultToEmpty) {
    auto result = parse_agent_config("role = \"building\"\nking_address = \"k\"\n");

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).skills.empty());
}

TEST(AgentConfigTest, RoundTripsThroughToml) {
    AgentConfig config;
    config.role = "evaluation";
    config.skills = {"grader"};
    config.king_address = "ws://127.0.0.1:3000";

    auto reparsed = parse_agent_config(evo::config::to_toml(config));

    ASSERT_FALSE(is_error(reparsed));
    EXPECT_EQ(get_value(reparsed), config);
}

TEST(AgentConfigTest, UnknownKeyIsRejected) {
    auto result = parse_agent_config(
        "role = \"learning\"\nking_address = \"k\"\nkingaddress = \"typo\"\n");

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_key");
    EXPECT_EQ(get_error(result).path, "kingaddress");
    ASSERT_TRUE(get_error(result).location.has_value());
    EXPECT_EQ(get_error(result).location->line, 3u);
}

TEST(AgentConfigTest, MissingKingAddressIsRejected) {
    auto result = parse_agent_config("role = \"learning\"\n");

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_field");
}
