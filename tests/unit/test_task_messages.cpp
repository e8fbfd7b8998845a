#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/task_messages.hpp"
#include "protocol/wire_codec.hpp"

namespace {

using evo::core::errors::ErrorCategory;
using evo::core::errors::get_error;
using evo::core::errors::get_value;
using evo::core::errors::is_error;
using evo::protocol::decode;
using evo::protocol::encode;
using evo::protocol::TaskCreate;
using evo::protocol::TaskEvaluate;
using evo::protocol::TaskList;
using evo::protocol::TaskOutput;
using evo::protocol::TaskRecord;
using evo::protocol::TaskStatus;
using evo::protocol::TaskSummary;
using evo::protocol::TaskUpdate;
using nlohmann::json;

}  // namespace

TEST(TaskMessagesTest, CreateDefaultsToEmptyPayload) {
    auto decoded = decode<TaskCreate>(R"({"task_type":"code"})");

    ASSERT_FALSE(is_error(decoded)) << get_error(decoded).describe();
    const auto& create = get_value(decoded);
    EXPECT_EQ(create.payload, json::object());
    EXPECT_FALSE(create.agent_id.has_value());
    EXPECT_FALSE(create.parent_id.has_value());
}

TEST(TaskMessagesTest, ListDefaultsToFiftyItems) {
    auto decoded = decode<TaskList>("{}");

    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded).limit, 50u);
    EXPECT_FALSE(get_value(decoded).status.has_value());
}

TEST(TaskMessagesTest, ListLimitMustFitInThirtyTwoBits) {
    auto decoded = decode<TaskList>(R"({"limit":4294967296})");

    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "out_of_range");
}

TEST(TaskMessagesTest, UpdateCarriesOnlyChangedFields) {
    TaskUpdate update;
    update.task_id = "t-1";
    update.status = TaskStatus::InProgress;

    const json encoded = json::parse(encode(update));
    EXPECT_EQ(encoded["status"], "in_progress");
    EXPECT_TRUE(encoded["payload"].is_null());

    auto decoded = decode<TaskUpdate>(encoded.dump());
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded), update);
}

TEST(TaskMessagesTest, RecordParentDefaultsToEmpty) {
    auto decoded = decode<TaskRecord>(
        R"({"id":"t-1","task_type":"code","status":"pending","agent_id":"",)"
        R"("payload":{"prompt":"hi"},"created_at":"2024-05-01T10:00:00Z",)"
        R"("updated_at":"2024-05-01T10:00:00Z"})");

    ASSERT_FALSE(is_error(decoded)) << get_error(decoded).describe();
    EXPECT_EQ(get_value(decoded).parent_id, "");
    EXPECT_EQ(get_value(decoded).payload["prompt"], "hi");
}

TEST(TaskMessagesTest, RecordWithoutPayloadIsRejected) {
    auto decoded = decode<TaskRecord>(
        R"({"id":"t-1","task_type":"code","status":"pending","agent_id":"",)"
        R"("created_at":"2024-05-01T10:00:00Z","updated_at":"2024-05-01T10:00:00Z"})");

    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).category, ErrorCategory::Schema);
    EXPECT_EQ(get_error(decoded).code, "missing_field");
    EXPECT_EQ(get_error(decoded).path, "payload");
}

TEST(TaskMessagesTest, OutputChunksRoundTrip) {
    TaskOutput output;
    output.task_id = "t-1";
    output.request_id = "req-9";
    output.source = "pty";
    output.delta = "$ cargo build\n";
    output.chunk_index = 4;
    output.is_final = true;

    auto decoded = decode<TaskOutput>(encode(output));

    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded), output);
}

TEST(TaskMessagesTest, EvaluateDefaultsAndNegativeExitCode) {
    auto defaults = decode<TaskEvaluate>(R"({"task_id":"t","task_type":"code"})");
    ASSERT_FALSE(is_error(defaults));
    EXPECT_EQ(get_value(defaults).output_summary, "");
    EXPECT_FALSE(get_value(defaults).exit_code.has_value());
    EXPECT_TRUE(get_value(defaults).metadata.is_null());

    TaskEvaluate evaluate;
    evaluate.task_id = "t";
    evaluate.task_type = "code";
    evaluate.exit_code = -9;
    evaluate.latency_ms = 1200;
    auto decoded = decode<TaskEvaluate>(encode(evaluate));
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded), evaluate);
}

TEST(TaskMessagesTest, SummaryDefaultsTagsToEmpty) {
    auto decoded = decode<TaskSummary>(
        R"({"task_id":"t","agent_id":"evaluation-001","summary":"built cleanly"})");

    ASSERT_FALSE(is_error(decoded));
    EXPECT_TRUE(get_value(decoded).tags.empty());
    EXPECT_FALSE(get_value(decoded).score.has_value());
    EXPECT_TRUE(get_value(decoded).evaluation.is_null());
}
