#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"
#include "core/codec/object_reader.hpp"

namespace evo::protocol {

    // Observable lifecycle phase of a runner. The coordinator interprets
    // transitions; nothing here enforces an order.
    enum class RunnerStatus {
        Starting,
        Ready,
        Busy,
        Error,
        Shutting
    };

    enum class PipelineRunStatus {
        Running,
        Completed,
        Failed,
        TimedOut
    };

    enum class TaskStatus {
        Pending,
        InProgress,
        Completed,
        Failed,
        Cancelled
    };

    struct SkillSuccess {};

    struct SkillFailure {
        std::string message;
    };

    struct SkillPartial {
        std::string message;
    };

    inline bool operator==(const SkillSuccess&, const SkillSuccess&) { return true; }
    inline bool operator==(const SkillFailure& lhs, const SkillFailure& rhs) {
        return lhs.message == rhs.message;
    }
    inline bool operator==(const SkillPartial& lhs, const SkillPartial& rhs) {
        return lhs.message == rhs.message;
    }

    // Encoded as "success", {"failure": "<message>"} or {"partial": "<message>"}.
    using SkillResult = std::variant<SkillSuccess, SkillFailure, SkillPartial>;

    nlohmann::json skill_result_to_json(const SkillResult& result);
    SkillResult read_skill_result(core::codec::ObjectReader& reader, const char* key);

}  // namespace evo::protocol

namespace evo::core::codec {

template <>
struct EnumNames<protocol::RunnerStatus> {
    static constexpr std::array<std::pair<protocol::RunnerStatus, std::string_view>, 5>
        entries{{
            {protocol::RunnerStatus::Starting, "starting"},
            {protocol::RunnerStatus::Ready, "ready"},
            {protocol::RunnerStatus::Busy, "busy"},
            {protocol::RunnerStatus::Error, "error"},
            {protocol::RunnerStatus::Shutting, "shutting"},
        }};
};

template <>
struct EnumNames<protocol::PipelineRunStatus> {
    static constexpr std::array<std::pair<protocol::PipelineRunStatus, std::string_view>, 4>
        entries{{
            {protocol::PipelineRunStatus::Running, "running"},
            {protocol::PipelineRunStatus::Completed, "completed"},
            {protocol::PipelineRunStatus::Failed, "failed"},
            {protocol::PipelineRunStatus::TimedOut, "timed_out"},
        }};
};

template <>
struct EnumNames<protocol::TaskStatus> {
    static constexpr std::array<std::pair<protocol::TaskStatus, std::string_view>, 5>
        entries{{
            {protocol::TaskStatus::Pending, "pending"},
            {protocol::TaskStatus::InProgress, "in_progress"},
            {protocol::TaskStatus::Completed, "completed"},
            {protocol::TaskStatus::Failed, "failed"},
            {protocol::TaskStatus::Cancelled, "cancelled"},
        }};
};

}  // namespace evo::core::codec
