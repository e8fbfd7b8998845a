#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"
#include "skill/skill_config.hpp"

namespace {

using evo::core::errors::get_error;
using evo::core::errors::get_value;
using evo::core::errors::is_error;
using evo::skill::HttpMethod;
using evo::skill::parse_skill_config;
using evo::skill::SkillConfig;
using evo::skill::SkillEndpoint;
using nlohmann::json;

}  // namespace

TEST(SkillConfigTest, ParsesEndpointsAndAuthRef) {
    auto result = parse_skill_config(R"(
auth_ref = "SEARCH_API_KEY"

[[endpoints]]
name = "search"
url = "https://api.search.com/v1/search"
method = "GET"

[endpoints.headers]
Accept = "application/json"
)");

    ASSERT_FALSE(is_error(result)) << get_error(result).describe();
    const auto& config = get_value(result);
    ASSERT_EQ(config.endpoints.size(), 1u);
    EXPECT_EQ(config.endpoints[0].method, HttpMethod::Get);
    EXPECT_EQ(config.endpoints[0].headers.at("Accept"), "application/json");
    EXPECT_EQ(config.auth_ref, "SEARCH_API_KEY");
    EXPECT_EQ(config.extra, json::object());
}

TEST(SkillConfigTest, MethodsAreUpperCase) {
    EXPECT_EQ(evo::core::codec::enum_name(HttpMethod::Patch), "PATCH");

    auto result = parse_skill_config(
        "[[endpoints]]\nname = \"e\"\nurl = \"u\"\nmethod = \"post\"\n");

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_variant");
    EXPECT_EQ(get_error(result).path, "endpoints[0].method");
}

TEST(SkillConfigTest, ExtraAcceptsAnyNestedContent) {
    auto result = parse_skill_config(R"(
[extra]
region = "eu-west-1"
weights = [0.5, 0.25, 0.25]

[extra.retry]
attempts = 3
backoff = { base_ms = 100, jitter = true }
)");

    ASSERT_FALSE(is_error(result)) << get_error(result).describe();
    const json& extra = get_value(result).extra;
    EXPECT_EQ(extra["region"], "eu-west-1");
    EXPECT_EQ(extra["weights"], json::array({0.5, 0.25, 0.25}));
    EXPECT_EQ(extra["retry"]["backoff"]["jitter"], true);
}

TEST(SkillConfigTest, ExtraSurvivesRoundTrip) {
    SkillConfig config;
    SkillEndpoint endpoint;
    endpoint.name = "submit";
    endpoint.url = "https://example.test/jobs";
    endpoint.method = HttpMethod::Post;
    endpoint.headers = {{"Content-Type", "application/json"}};
    config.endpoints = {endpoint};
    config.extra = {
        {"queue", "batch"},
        {"stages", json::array({"fetch", "parse", "store"})},
        {"limits", {{"max_bytes", 1048576}, {"nested", {{"deep", false}}}}},
        {"targets", json::array({json{{"host", "a"}}, json{{"host", "b"}}})},
    };

    auto reparsed = parse_skill_config(evo::skill::to_toml(config));

    ASSERT_FALSE(is_error(reparsed)) << get_error(reparsed).describe();
    EXPECT_EQ(get_value(reparsed), config);
    EXPECT_EQ(get_value(reparsed).extra["stages"][2], "store");
}

TEST(SkillConfigTest, UnknownTopLevelKeyIsRejected) {
    auto result = parse_skill_config("auth_ref = \"K\"\ntimeout = 5\n");

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_key");
    EXPECT_EQ(get_error(result).path, "timeout");
}
