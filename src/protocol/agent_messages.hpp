#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/codec/object_reader.hpp"
#include "protocol/role_contract.hpp"
#include "protocol/status_contract.hpp"

namespace evo::protocol {

    using JsonMap = std::map<std::string, nlohmann::json>;

    // agent:register. Agents may attach extra untyped fields (e.g. their
    // skill list); decoding keeps only the typed subset below.
    struct AgentRegister {
        std::string agent_id;
        AgentRole role = PipelineRole::Learning;
        std::vector<std::string> capabilities;
    };

    // agent:status
    struct AgentStatus {
        std::string agent_id;
        RunnerStatus status = RunnerStatus::Starting;
        JsonMap metrics;
    };

    // agent:skill_report
    struct AgentSkillReport {
        std::string agent_id;
        std::string skill_id;
        SkillResult result;
        std::optional<double> score;
    };

    struct HealthCheck {
        std::string name;
        std::string endpoint;
        bool healthy = false;
        std::optional<std::uint64_t> latency_ms;
        std::optional<std::string> error;
    };

    // agent:health
    struct AgentHealth {
        std::string agent_id;
        std::vector<HealthCheck> health_checks;
    };

    // king:command
    struct KingCommand {
        std::string command;
        std::string target_agent;
        JsonMap params;
    };

    // king:config_update. The hash is computed by the king over the
    // canonical JSON encoding of the new configuration.
    struct KingConfigUpdate {
        std::string config_type;
        std::string new_config_hash;
    };

    bool operator==(const AgentRegister& lhs, const AgentRegister& rhs);
    bool operator==(const AgentStatus& lhs, const AgentStatus& rhs);
    bool operator==(const AgentSkillReport& lhs, const AgentSkillReport& rhs);
    bool operator==(const HealthCheck& lhs, const HealthCheck& rhs);
    bool operator==(const AgentHealth& lhs, const AgentHealth& rhs);
    bool operator==(const KingCommand& lhs, const KingCommand& rhs);
    bool operator==(const KingConfigUpdate& lhs, const KingConfigUpdate& rhs);

    void to_json(nlohmann::json& j, const AgentRegister& message);
    void to_json(nlohmann::json& j, const AgentStatus& message);
    void to_json(nlohmann::json& j, const AgentSkillReport& message);
    void to_json(nlohmann::json& j, const HealthCheck& message);
    void to_json(nlohmann::json& j, const AgentHealth& message);
    void to_json(nlohmann::json& j, const KingCommand& message);
    void to_json(nlohmann::json& j, const KingConfigUpdate& message);

    void read_fields(core::codec::ObjectReader& reader, AgentRegister& out);
    void read_fields(core::codec::ObjectReader& reader, AgentStatus& out);
    void read_fields(core::codec::ObjectReader& reader, AgentSkillReport& out);
    void read_fields(core::codec::ObjectReader& reader, HealthCheck& out);
    void read_fields(core::codec::ObjectReader& reader, AgentHealth& out);
    void read_fields(core::codec::ObjectReader& reader, KingCommand& out);
    void read_fields(core::codec::ObjectReader& reader, KingConfigUpdate& out);

}  // namespace evo::protocol
