#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/contract_errors.hpp"

namespace evo::config {

    using core::errors::Result;

    // Per-agent process settings. `role` is kept as written; mapping it onto
    // a pipeline role is left to the agent runtime.
    struct AgentConfig {
        std::string role;
        std::vector<std::string> skills;
        std::string king_address;
    };

    bool operator==(const AgentConfig& lhs, const AgentConfig& rhs);

    Result<AgentConfig> parse_agent_config(std::string_view text);
    std::string to_toml(const AgentConfig& config);

    void to_json(nlohmann::json& j, const AgentConfig& config);

}  // namespace evo::config
