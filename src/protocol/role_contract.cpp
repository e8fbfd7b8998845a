#include "protocol/role_contract.hpp"

namespace evo::protocol {

using core::codec::ObjectReader;
using nlohmann::json;

namespace {

constexpr const char* kUserTag = "user";

}  // namespace

PipelineRole role_for_stage(const PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Learning:
            return PipelineRole::Learning;
        case PipelineStage::Building:
            return PipelineRole::Building;
        case PipelineStage::PreLoad:
            return PipelineRole::PreLoad;
        case PipelineStage::Evaluation:
            return PipelineRole::Evaluation;
        case PipelineStage::SkillManage:
        default:
            return PipelineRole::SkillManage;
    }
}

PipelineStage stage_for_role(const PipelineRole role) {
    switch (role) {
        case PipelineRole::Learning:
            return PipelineStage::Learning;
        case PipelineRole::Building:
            return PipelineStage::Building;
        case PipelineRole::PreLoad:
            return PipelineStage::PreLoad;
        case PipelineRole::Evaluation:
            return PipelineStage::Evaluation;
        case PipelineRole::SkillManage:
        default:
            return PipelineStage::SkillManage;
    }
}

PipelineStage next_stage(const PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Learning:
            return PipelineStage::Building;
        case PipelineStage::Building:
            return PipelineStage::PreLoad;
        case PipelineStage::PreLoad:
            return PipelineStage::Evaluation;
        case PipelineStage::Evaluation:
            return PipelineStage::SkillManage;
        case PipelineStage::SkillManage:
        default:
            return PipelineStage::Learning;
    }
}

bool is_pipeline_role(const AgentRole& role) {
    return std::holds_alternative<PipelineRole>(role);
}

std::string role_name(const AgentRole& role) {
    if (const auto* canonical = std::get_if<PipelineRole>(&role)) {
        return std::string(core::codec::enum_name(*canonical));
    }
    return std::get<UserRole>(role).name;
}

AgentRole role_from_name(const std::string_view name) {
    const auto canonical = core::codec::enum_from_name<PipelineRole>(name);
    if (canonical.has_value()) {
        return *canonical;
    }
    return UserRole{std::string(name)};
}

json role_to_json(const AgentRole& role) {
    if (const auto* canonical = std::get_if<PipelineRole>(&role)) {
        return std::string(core::codec::enum_name(*canonical));
    }
    json tagged = json::object();
    tagged[kUserTag] = std::get<UserRole>(role).name;
    return tagged;
}

AgentRole read_role(ObjectReader& reader, const char* key) {
    const json& value = reader.require(key);
    if (value.is_string()) {
        const auto& name = value.get_ref<const std::string&>();
        const auto canonical = core::codec::enum_from_name<PipelineRole>(name);
        if (!canonical.has_value()) {
            reader.fail(key, "unknown_variant",
                        "unknown variant `" + name + "`, expected one of " +
                            core::codec::enum_name_list<PipelineRole>() +
                            " or {\"user\": <name>}");
        }
        return *canonical;
    }
    if (value.is_object()) {
        const auto tag = value.find(kUserTag);
        if (value.size() != 1 || tag == value.end()) {
            reader.fail(key, "unknown_variant",
                        "tagged role must be a single-key object {\"user\": <name>}");
        }
        if (!tag->is_string()) {
            reader.fail_type(std::string(key) + "." + kUserTag, "string", *tag);
        }
        return UserRole{tag->get<std::string>()};
    }
    reader.fail_type(key, "string or object", value);
}

}  // namespace evo::protocol
