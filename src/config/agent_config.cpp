#include "config/agent_config.hpp"

#include "core/codec/document_decoder.hpp"
#include "core/codec/object_reader.hpp"
#include "core/codec/toml_document.hpp"

namespace evo::config {

using core::codec::ObjectReader;
using nlohmann::json;

namespace {

AgentConfig read_agent(ObjectReader& reader) {
    AgentConfig config;
    config.role = reader.required_string("role");
    config.skills = reader.string_list_or_empty("skills");
    config.king_address = reader.required_string("king_address");
    return config;
}

}  // namespace

bool operator==(const AgentConfig& lhs, const AgentConfig& rhs) {
    return lhs.role == rhs.role && lhs.skills == rhs.skills &&
           lhs.king_address == rhs.king_address;
}

void to_json(json& j, const AgentConfig& config) {
    j = json::object();
    j["role"] = config.role;
    j["skills"] = config.skills;
    j["king_address"] = config.king_address;
}

Result<AgentConfig> parse_agent_config(const std::string_view text) {
    return core::codec::decode_toml_document<AgentConfig>(text, read_agent);
}

std::string to_toml(const AgentConfig& config) {
    return core::codec::write_toml(json(config));
}

}  // namespace evo::config
