#include "protocol/task_messages.hpp"

#include <limits>
#include "core/codec/json_values.hpp"

namespace evo::protocol {

using core::codec::ObjectReader;
using core::codec::optional_enum_to_json;
using core::codec::optional_to_json;
using nlohmann::json;

namespace {

constexpr std::uint64_t kU32Max = std::numeric_limits<std::uint32_t>::max();

}  // namespace

bool operator==(const TaskCreate& lhs, const TaskCreate& rhs) {
    return lhs.task_type == rhs.task_type && lhs.agent_id == rhs.agent_id &&
           lhs.payload == rhs.payload && lhs.parent_id == rhs.parent_id;
}

bool operator==(const TaskUpdate& lhs, const TaskUpdate& rhs) {
    return lhs.task_id == rhs.task_id && lhs.status == rhs.status &&
           lhs.agent_id == rhs.agent_id && lhs.payload == rhs.payload;
}

bool operator==(const TaskGet& lhs, const TaskGet& rhs) {
    return lhs.task_id == rhs.task_id;
}

bool operator==(const TaskList& lhs, const TaskList& rhs) {
    return lhs.limit == rhs.limit && lhs.status == rhs.status &&
           lhs.agent_id == rhs.agent_id && lhs.parent_id == rhs.parent_id;
}

bool operator==(const TaskDelete& lhs, const TaskDelete& rhs) {
    return lhs.task_id == rhs.task_id;
}

bool operator==(const TaskRecord& lhs, const TaskRecord& rhs) {
    return lhs.id == rhs.id && lhs.task_type == rhs.task_type &&
           lhs.status == rhs.status && lhs.agent_id == rhs.agent_id &&
           lhs.payload == rhs.payload && lhs.parent_id == rhs.parent_id &&
           lhs.created_at == rhs.created_at && lhs.updated_at == rhs.updated_at;
}

bool operator==(const TaskInvite& lhs, const TaskInvite& rhs) {
    return lhs.task_id == rhs.task_id && lhs.task_type == rhs.task_type &&
           lhs.payload == rhs.payload;
}

bool operator==(const TaskOutput& lhs, const TaskOutput& rhs) {
    return lhs.task_id == rhs.task_id && lhs.request_id == rhs.request_id &&
           lhs.source == rhs.source && lhs.delta == rhs.delta &&
           lhs.chunk_index == rhs.chunk_index && lhs.is_final == rhs.is_final;
}

bool operator==(const TaskEvaluate& lhs, const TaskEvaluate& rhs) {
    return lhs.task_id == rhs.task_id && lhs.task_type == rhs.task_type &&
           lhs.output_summary == rhs.output_summary &&
           lhs.exit_code == rhs.exit_code && lhs.latency_ms == rhs.latency_ms &&
           lhs.metadata == rhs.metadata;
}

bool operator==(const TaskSummary& lhs, const TaskSummary& rhs) {
    return lhs.task_id == rhs.task_id && lhs.agent_id == rhs.agent_id &&
           lhs.summary == rhs.summary && lhs.score == rhs.score &&
           lhs.tags == rhs.tags && lhs.evaluation == rhs.evaluation;
}

void to_json(json& j, const TaskCreate& message) {
    j = json::object();
    j["task_type"] = message.task_type;
    j["agent_id"] = optional_to_json(message.agent_id);
    j["payload"] = message.payload;
    j["parent_id"] = optional_to_json(message.parent_id);
}

void to_json(json& j, const TaskUpdate& message) {
    j = json::object();
    j["task_id"] = message.task_id;
    j["status"] = optional_enum_to_json(message.status);
    j["agent_id"] = optional_to_json(message.agent_id);
    j["payload"] = optional_to_json(message.payload);
}

void to_json(json& j, const TaskGet& message) {
    j = json::object();
    j["task_id"] = message.task_id;
}

void to_json(json& j, const TaskList& message) {
    j = json::object();
    j["limit"] = message.limit;
    j["status"] = optional_enum_to_json(message.status);
    j["agent_id"] = optional_to_json(message.agent_id);
    j["parent_id"] = optional_to_json(message.parent_id);
}

void to_json(json& j, const TaskDelete& message) {
    j = json::object();
    j["task_id"] = message.task_id;
}

void to_json(json& j, const TaskRecord& message) {
    j = json::object();
    j["id"] = message.id;
    j["task_type"] = message.task_type;
    j["status"] = message.status;
    j["agent_id"] = message.agent_id;
    j["payload"] = message.payload;
    j["parent_id"] = message.parent_id;
    j["created_at"] = message.created_at;
    j["updated_at"] = message.updated_at;
}

void to_json(json& j, const TaskInvite& message) {
    j = json::object();
    j["task_id"] = message.task_id;
    j["task_type"] = message.task_type;
    j["payload"] = message.payload;
}

void to_json(json& j, const TaskOutput& message) {
    j = json::object();
    j["task_id"] = message.task_id;
    j["request_id"] = message.request_id;
    j["source"] = message.source;
    j["delta"] = message.delta;
    j["chunk_index"] = message.chunk_index;
    j["is_final"] = message.is_final;
}

void to_json(json& j, const TaskEvaluate& message) {
    j = json::object();
    j["task_id"] = message.task_id;
    j["task_type"] = message.task_type;
    j["output_summary"] = message.output_summary;
    j["exit_code"] = optional_to_json(message.exit_code);
    j["latency_ms"] = optional_to_json(message.latency_ms);
    j["metadata"] = message.metadata;
}

void to_json(json& j, const TaskSummary& message) {
    j = json::object();
    j["task_id"] = message.task_id;
    j["agent_id"] = message.agent_id;
    j["summary"] = message.summary;
    j["score"] = optional_to_json(message.score);
    j["tags"] = message.tags;
    j["evaluation"] = message.evaluation;
}

void read_fields(ObjectReader& reader, TaskCreate& out) {
    out.task_type = reader.required_string("task_type");
    out.agent_id = reader.optional_string("agent_id");
    out.payload = reader.value_or("payload", json::object());
    out.parent_id = reader.optional_string("parent_id");
}

void read_fields(ObjectReader& reader, TaskUpdate& out) {
    out.task_id = reader.required_string("task_id");
    out.status = reader.optional_enum<TaskStatus>("status");
    out.agent_id = reader.optional_string("agent_id");
    out.payload = reader.optional_value("payload");
}

void read_fields(ObjectReader& reader, TaskGet& out) {
    out.task_id = reader.required_string("task_id");
}

void read_fields(ObjectReader& reader, TaskList& out) {
    out.limit = static_cast<std::uint32_t>(
        reader.unsigned_or("limit", kDefaultTaskListLimit, kU32Max));
    out.status = reader.optional_enum<TaskStatus>("status");
    out.agent_id = reader.optional_string("agent_id");
    out.parent_id = reader.optional_string("parent_id");
}

void read_fields(ObjectReader& reader, TaskDelete& out) {
    out.task_id = reader.required_string("task_id");
}

void read_fields(ObjectReader& reader, TaskRecord& out) {
    out.id = reader.required_string("id");
    out.task_type = reader.required_string("task_type");
    out.status = reader.required_string("status");
    out.agent_id = reader.required_string("agent_id");
    out.payload = reader.require("payload");
    out.parent_id = reader.string_or("parent_id", "");
    out.created_at = reader.required_string("created_at");
    out.updated_at = reader.required_string("updated_at");
}

void read_fields(ObjectReader& reader, TaskInvite& out) {
    out.task_id = reader.required_string("task_id");
    out.task_type = reader.required_string("task_type");
    out.payload = reader.value_or("payload", nullptr);
}

void read_fields(ObjectReader& reader, TaskOutput& out) {
    out.task_id = reader.required_string("task_id");
    out.request_id = reader.required_string("request_id");
    out.source = reader.required_string("source");
    out.delta = reader.required_string("delta");
    out.chunk_index = static_cast<std::uint32_t>(
        reader.required_unsigned("chunk_index", kU32Max));
    out.is_final = reader.bool_or("is_final", false);
}

void read_fields(ObjectReader& reader, TaskEvaluate& out) {
    out.task_id = reader.required_string("task_id");
    out.task_type = reader.required_string("task_type");
    out.output_summary = reader.string_or("output_summary", "");
    const auto exit_code = reader.optional_integer(
        "exit_code", std::numeric_limits<std::int32_t>::min(),
        std::numeric_limits<std::int32_t>::max());
    out.exit_code.reset();
    if (exit_code.has_value()) {
        out.exit_code = static_cast<std::int32_t>(*exit_code);
    }
    out.latency_ms = reader.optional_unsigned("latency_ms");
    out.metadata = reader.value_or("metadata", nullptr);
}

void read_fields(ObjectReader& reader, TaskSummary& out) {
    out.task_id = reader.required_string("task_id");
    out.agent_id = reader.required_string("agent_id");
    out.summary = reader.required_string("summary");
    out.score = reader.optional_number("score");
    out.tags = reader.string_list_or_empty("tags");
    out.evaluation = reader.value_or("evaluation", nullptr);
}

}  // namespace evo::protocol
