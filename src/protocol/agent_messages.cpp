#include "protocol/agent_messages.hpp"

#include "core/codec/json_values.hpp"

namespace evo::protocol {

using core::codec::enum_to_json;
using core::codec::ObjectReader;
using core::codec::optional_to_json;
using nlohmann::json;

bool operator==(const AgentRegister& lhs, const AgentRegister& rhs) {
    return lhs.agent_id == rhs.agent_id && lhs.role == rhs.role &&
           lhs.capabilities == rhs.capabilities;
}

bool operator==(const AgentStatus& lhs, const AgentStatus& rhs) {
    return lhs.agent_id == rhs.agent_id && lhs.status == rhs.status &&
           lhs.metrics == rhs.metrics;
}

bool operator==(const AgentSkillReport& lhs, const AgentSkillReport& rhs) {
    return lhs.agent_id == rhs.agent_id && lhs.skill_id == rhs.skill_id &&
           lhs.result == rhs.result && lhs.score == rhs.score;
}

bool operator==(const HealthCheck& lhs, const HealthCheck& rhs) {
    return lhs.name == rhs.name && lhs.endpoint == rhs.endpoint &&
           lhs.healthy == rhs.healthy && lhs.latency_ms == rhs.latency_ms &&
           lhs.error == rhs.error;
}

bool operator==(const AgentHealth& lhs, const AgentHealth& rhs) {
    return lhs.agent_id == rhs.agent_id && lhs.health_checks == rhs.health_checks;
}

bool operator==(const KingCommand& lhs, const KingCommand& rhs) {
    return lhs.command == rhs.command && lhs.target_agent == rhs.target_agent &&
           lhs.params == rhs.params;
}

bool operator==(const KingConfigUpdate& lhs, const KingConfigUpdate& rhs) {
    return lhs.config_type == rhs.config_type &&
           lhs.new_config_hash == rhs.new_config_hash;
}

void to_json(json& j, const AgentRegister& message) {
    j = json::object();
    j["agent_id"] = message.agent_id;
    j["role"] = role_to_json(message.role);
    j["capabilities"] = message.capabilities;
}

void to_json(json& j, const AgentStatus& message) {
    j = json::object();
    j["agent_id"] = message.agent_id;
    j["status"] = enum_to_json(message.status);
    j["metrics"] = message.metrics;
}

void to_json(json& j, const AgentSkillReport& message) {
    j = json::object();
    j["agent_id"] = message.agent_id;
    j["skill_id"] = message.skill_id;
    j["result"] = skill_result_to_json(message.result);
    j["score"] = optional_to_json(message.score);
}

void to_json(json& j, const HealthCheck& message) {
    j = json::object();
    j["name"] = message.name;
    j["endpoint"] = message.endpoint;
    j["healthy"] = message.healthy;
    j["latency_ms"] = optional_to_json(message.latency_ms);
    j["error"] = optional_to_json(message.error);
}

void to_json(json& j, const AgentHealth& message) {
    j = json::object();
    j["agent_id"] = message.agent_id;
    j["health_checks"] = message.health_checks;
}

void to_json(json& j, const KingCommand& message) {
    j = json::object();
    j["command"] = message.command;
    j["target_agent"] = message.target_agent;
    j["params"] = message.params;
}

void to_json(json& j, const KingConfigUpdate& message) {
    j = json::object();
    j["config_type"] = message.config_type;
    j["new_config_hash"] = message.new_config_hash;
}

void read_fields(ObjectReader& reader, AgentRegister& out) {
    out.agent_id = reader.required_string("agent_id");
    out.role = read_role(reader, "role");
    out.capabilities = reader.required_string_list("capabilities");
}

void read_fields(ObjectReader& reader, AgentStatus& out) {
    out.agent_id = reader.required_string("agent_id");
    out.status = reader.required_enum<RunnerStatus>("status");
    out.metrics = reader.required_value_map("metrics");
}

void read_fields(ObjectReader& reader, AgentSkillReport& out) {
    out.agent_id = reader.required_string("agent_id");
    out.skill_id = reader.required_string("skill_id");
    out.result = read_skill_result(reader, "result");
    out.score = reader.optional_number("score");
}

void read_fields(ObjectReader& reader, HealthCheck& out) {
    out.name = reader.required_string("name");
    out.endpoint = reader.required_string("endpoint");
    out.healthy = reader.required_bool("healthy");
    out.latency_ms = reader.optional_unsigned("latency_ms");
    out.error = reader.optional_string("error");
}

void read_fields(ObjectReader& reader, AgentHealth& out) {
    out.agent_id = reader.required_string("agent_id");
    out.health_checks.clear();
    for (auto& entry : reader.required_object_list("health_checks")) {
        HealthCheck check;
        read_fields(entry, check);
        out.health_checks.push_back(std::move(check));
    }
}

void read_fields(ObjectReader& reader, KingCommand& out) {
    out.command = reader.required_string("command");
    out.target_agent = reader.required_string("target_agent");
    out.params = reader.required_value_map("params");
}

void read_fields(ObjectReader& reader, KingConfigUpdate& out) {
    out.config_type = reader.required_string("config_type");
    out.new_config_hash = reader.required_string("new_config_hash");
}

}  // namespace evo::protocol
