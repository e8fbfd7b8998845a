#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/codec/object_reader.hpp"
#include "protocol/agent_messages.hpp"
#include "protocol/role_contract.hpp"
#include "protocol/status_contract.hpp"

namespace evo::protocol {

    // pipeline:next, king -> agents holding the role for `stage`
    struct PipelineNext {
        PipelineStage stage = PipelineStage::Learning;
        std::string artifact_id;
        JsonMap metadata;
    };

    // pipeline:stage_result, agent -> king
    struct PipelineStageResult {
        std::string run_id;
        PipelineStage stage = PipelineStage::Learning;
        std::string agent_id;
        PipelineRunStatus status = PipelineRunStatus::Running;
        std::string artifact_id;
        nlohmann::json output;  // free-form, null when the stage produced nothing
        std::optional<std::string> error;
    };

    bool operator==(const PipelineNext& lhs, const PipelineNext& rhs);
    bool operator==(const PipelineStageResult& lhs, const PipelineStageResult& rhs);

    void to_json(nlohmann::json& j, const PipelineNext& message);
    void to_json(nlohmann::json& j, const PipelineStageResult& message);

    void read_fields(core::codec::ObjectReader& reader, PipelineNext& out);
    void read_fields(core::codec::ObjectReader& reader, PipelineStageResult& out);

}  // namespace evo::protocol
