#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/pipeline_messages.hpp"
#include "protocol/wire_codec.hpp"

namespace {

using evo::core::errors::ErrorCategory;
using evo::core::errors::get_error;
using evo::core::errors::get_value;
using evo::core::errors::is_error;
using evo::protocol::decode;
using evo::protocol::encode;
using evo::protocol::PipelineNext;
using evo::protocol::PipelineRunStatus;
using evo::protocol::PipelineStage;
using evo::protocol::PipelineStageResult;
using nlohmann::json;

}  // namespace

TEST(PipelineMessagesTest, NextUsesSnakeCaseStage) {
    PipelineNext next;
    next.stage = PipelineStage::PreLoad;
    next.artifact_id = "artifact-17";
    next.metadata = {{"run_id", "run-3"}};

    const json encoded = json::parse(encode(next));
    EXPECT_EQ(encoded["stage"], "pre_load");

    auto decoded = decode<PipelineNext>(encoded.dump());
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded), next);
}

TEST(PipelineMessagesTest, StageResultRoundTrips) {
    PipelineStageResult result;
    result.run_id = "run-3";
    result.stage = PipelineStage::Evaluation;
    result.agent_id = "evaluation-001";
    result.status = PipelineRunStatus::TimedOut;
    result.artifact_id = "artifact-17";
    result.output = {{"scores", json::array({0.25, 0.5})}};
    result.error = "stage exceeded 300s";

    auto decoded = decode<PipelineStageResult>(encode(result));

    ASSERT_FALSE(is_error(decoded)) << get_error(decoded).describe();
    EXPECT_EQ(get_value(decoded), result);
}

TEST(PipelineMessagesTest, MissingOutputIsRejected) {
    auto decoded = decode<PipelineStageResult>(
        R"({"run_id":"r","stage":"building","agent_id":"a","status":"completed",)"
        R"("artifact_id":"x"})");

    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).category, ErrorCategory::Schema);
    EXPECT_EQ(get_error(decoded).code, "missing_field");
    EXPECT_EQ(get_error(decoded).path, "output");
}

TEST(PipelineMessagesTest, ExplicitNullOutputIsAccepted) {
    auto decoded = decode<PipelineStageResult>(
        R"({"run_id":"r","stage":"building","agent_id":"a","status":"completed",)"
        R"("artifact_id":"x","output":null})");

    ASSERT_FALSE(is_error(decoded)) << get_error(decoded).describe();
    EXPECT_TRUE(get_value(decoded).output.is_null());
    EXPECT_FALSE(get_value(decoded).error.has_value());
}

TEST(PipelineMessagesTest, UnknownStageIsRejected) {
    auto decoded = decode<PipelineNext>(
        R"({"stage":"deploying","artifact_id":"x","metadata":{}})");

    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "unknown_variant");
    EXPECT_EQ(get_error(decoded).path, "stage");
}
