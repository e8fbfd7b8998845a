#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/codec/object_reader.hpp"
#include "protocol/status_contract.hpp"

namespace evo::protocol {

    inline constexpr std::uint32_t kDefaultTaskListLimit = 50;

    // task:create
    struct TaskCreate {
        std::string task_type;
        std::optional<std::string> agent_id;
        nlohmann::json payload = nlohmann::json::object();
        std::optional<std::string> parent_id;
    };

    // task:update. Only the fields present are changed.
    struct TaskUpdate {
        std::string task_id;
        std::optional<TaskStatus> status;
        std::optional<std::string> agent_id;
        std::optional<nlohmann::json> payload;
    };

    // task:get
    struct TaskGet {
        std::string task_id;
    };

    // task:list
    struct TaskList {
        std::uint32_t limit = kDefaultTaskListLimit;
        std::optional<TaskStatus> status;
        std::optional<std::string> agent_id;
        std::optional<std::string> parent_id;
    };

    // task:delete
    struct TaskDelete {
        std::string task_id;
    };

    // A stored task as returned by the king in task:changed and list replies.
    // Status and timestamps are carried as the store writes them.
    struct TaskRecord {
        std::string id;
        std::string task_type;
        std::string status;
        std::string agent_id;
        nlohmann::json payload;
        std::string parent_id;
        std::string created_at;
        std::string updated_at;
    };

    // task:invite, king asks agents to join the room task:<task_id>
    struct TaskInvite {
        std::string task_id;
        std::string task_type;
        nlohmann::json payload;
    };

    // task:output, one streamed chunk. `source` is "pty" or "llm".
    struct TaskOutput {
        std::string task_id;
        std::string request_id;
        std::string source;
        std::string delta;
        std::uint32_t chunk_index = 0;
        bool is_final = false;
    };

    // task:evaluate
    struct TaskEvaluate {
        std::string task_id;
        std::string task_type;
        std::string output_summary;  // accumulated output, may be truncated
        std::optional<std::int32_t> exit_code;
        std::optional<std::uint64_t> latency_ms;
        nlohmann::json metadata;
    };

    // task:summary
    struct TaskSummary {
        std::string task_id;
        std::string agent_id;
        std::string summary;
        std::optional<double> score;
        std::vector<std::string> tags;
        nlohmann::json evaluation;
    };

    bool operator==(const TaskCreate& lhs, const TaskCreate& rhs);
    bool operator==(const TaskUpdate& lhs, const TaskUpdate& rhs);
    bool operator==(const TaskGet& lhs, const TaskGet& rhs);
    bool operator==(const TaskList& lhs, const TaskList& rhs);
    bool operator==(const TaskDelete& lhs, const TaskDelete& rhs);
    bool operator==(const TaskRecord& lhs, const TaskRecord& rhs);
    bool operator==(const TaskInvite& lhs, const TaskInvite& rhs);
    bool operator==(const TaskOutput& lhs, const TaskOutput& rhs);
    bool operator==(const TaskEvaluate& lhs, const TaskEvaluate& rhs);
    bool operator==(const TaskSummary& lhs, const TaskSummary& rhs);

    void to_json(nlohmann::json& j, const TaskCreate& message);
    void to_json(nlohmann::json& j, const TaskUpdate& message);
    void to_json(nlohmann::json& j, const TaskGet& message);
    void to_json(nlohmann::json& j, const TaskList& message);
    void to_json(nlohmann::json& j, const TaskDelete& message);
    void to_json(nlohmann::json& j, const TaskRecord& message);
    void to_json(nlohmann::json& j, const TaskInvite& message);
    void to_json(nlohmann::json& j, const TaskOutput& message);
    void to_json(nlohmann::json& j, const TaskEvaluate& message);
    void to_json(nlohmann::json& j, const TaskSummary& message);

    void read_fields(core::codec::ObjectReader& reader, TaskCreate& out);
    void read_fields(core::codec::ObjectReader& reader, TaskUpdate& out);
    void read_fields(core::codec::ObjectReader& reader, TaskGet& out);
    void read_fields(core::codec::ObjectReader& reader, TaskList& out);
    void read_fields(core::codec::ObjectReader& reader, TaskDelete& out);
    void read_fields(core::codec::ObjectReader& reader, TaskRecord& out);
    void read_fields(core::codec::ObjectReader& reader, TaskInvite& out);
    void read_fields(core::codec::ObjectReader& reader, TaskOutput& out);
    void read_fields(core::codec::ObjectReader& reader, TaskEvaluate& out);
    void read_fields(core::codec::ObjectReader& reader, TaskSummary& out);

}  // namespace evo::protocol
