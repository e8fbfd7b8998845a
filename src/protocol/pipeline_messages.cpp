#include "protocol/pipeline_messages.hpp"

#include "core/codec/json_values.hpp"

namespace evo::protocol {

using core::codec::enum_to_json;
using core::codec::ObjectReader;
using core::codec::optional_to_json;
using nlohmann::json;

bool operator==(const PipelineNext& lhs, const PipelineNext& rhs) {
    return lhs.stage == rhs.stage && lhs.artifact_id == rhs.artifact_id &&
           lhs.metadata == rhs.metadata;
}

bool operator==(const PipelineStageResult& lhs, const PipelineStageResult& rhs) {
    return lhs.run_id == rhs.run_id && lhs.stage == rhs.stage &&
           lhs.agent_id == rhs.agent_id && lhs.status == rhs.status &&
           lhs.artifact_id == rhs.artifact_id && lhs.output == rhs.output &&
           lhs.error == rhs.error;
}

void to_json(json& j, const PipelineNext& message) {
    j = json::object();
    j["stage"] = enum_to_json(message.stage);
    j["artifact_id"] = message.artifact_id;
    j["metadata"] = message.metadata;
}

void to_json(json& j, const PipelineStageResult& message) {
    j = json::object();
    j["run_id"] = message.run_id;
    j["stage"] = enum_to_json(message.stage);
    j["agent_id"] = message.agent_id;
    j["status"] = enum_to_json(message.status);
    j["artifact_id"] = message.artifact_id;
    j["output"] = message.output;
    j["error"] = optional_to_json(message.error);
}

void read_fields(ObjectReader& reader, PipelineNext& out) {
    out.stage = reader.required_enum<PipelineStage>("stage");
    out.artifact_id = reader.required_string("artifact_id");
    out.metadata = reader.required_value_map("metadata");
}

void read_fields(ObjectReader& reader, PipelineStageResult& out) {
    out.run_id = reader.required_string("run_id");
    out.stage = reader.required_enum<PipelineStage>("stage");
    out.agent_id = reader.required_string("agent_id");
    out.status = reader.required_enum<PipelineRunStatus>("status");
    out.artifact_id = reader.required_string("artifact_id");
    out.output = reader.require("output");
    out.error = reader.optional_string("error");
}

}  // namespace evo::protocol
