#pragma once

#include <array>
#include <string>
#include <string_view>
#include "protocol/role_contract.hpp"

// Literal event and room names on the shared event channel. These strings
// are part of the wire contract; changing one requires a coordinated version
// bump across every participant.
namespace evo::protocol::events {

    // Agent -> king
    inline constexpr std::string_view kAgentRegister = "agent:register";
    inline constexpr std::string_view kAgentStatus = "agent:status";
    inline constexpr std::string_view kAgentSkillReport = "agent:skill_report";
    inline constexpr std::string_view kAgentHealth = "agent:health";

    // King -> agent
    inline constexpr std::string_view kKingCommand = "king:command";
    inline constexpr std::string_view kKingConfigUpdate = "king:config_update";

    // Pipeline coordination
    inline constexpr std::string_view kPipelineNext = "pipeline:next";
    inline constexpr std::string_view kPipelineStageResult = "pipeline:stage_result";

    // Task management
    inline constexpr std::string_view kTaskCreate = "task:create";
    inline constexpr std::string_view kTaskUpdate = "task:update";
    inline constexpr std::string_view kTaskGet = "task:get";
    inline constexpr std::string_view kTaskList = "task:list";
    inline constexpr std::string_view kTaskDelete = "task:delete";
    inline constexpr std::string_view kTaskChanged = "task:changed";

    // Debug
    inline constexpr std::string_view kDebugPrompt = "debug:prompt";
    inline constexpr std::string_view kDebugResponse = "debug:response";
    inline constexpr std::string_view kDebugStream = "debug:stream";

    // Memory
    inline constexpr std::string_view kMemoryStore = "memory:store";
    inline constexpr std::string_view kMemoryQuery = "memory:query";
    inline constexpr std::string_view kMemoryUpdate = "memory:update";
    inline constexpr std::string_view kMemoryDelete = "memory:delete";
    inline constexpr std::string_view kMemoryChanged = "memory:changed";

    // Task rooms
    inline constexpr std::string_view kTaskInvite = "task:invite";
    inline constexpr std::string_view kTaskJoin = "task:join";
    inline constexpr std::string_view kTaskOutput = "task:output";
    inline constexpr std::string_view kTaskEvaluate = "task:evaluate";
    inline constexpr std::string_view kTaskSummary = "task:summary";
    inline constexpr std::string_view kTaskLog = "task:log";

    inline constexpr std::array<std::string_view, 28> kAllEvents{{
        kAgentRegister, kAgentStatus, kAgentSkillReport, kAgentHealth,
        kKingCommand, kKingConfigUpdate,
        kPipelineNext, kPipelineStageResult,
        kTaskCreate, kTaskUpdate, kTaskGet, kTaskList, kTaskDelete, kTaskChanged,
        kDebugPrompt, kDebugResponse, kDebugStream,
        kMemoryStore, kMemoryQuery, kMemoryUpdate, kMemoryDelete, kMemoryChanged,
        kTaskInvite, kTaskJoin, kTaskOutput, kTaskEvaluate, kTaskSummary, kTaskLog,
    }};

    // Rooms
    inline constexpr std::string_view kRoomKernel = "kernel";  // default broadcast room
    inline constexpr std::string_view kRoomRolePrefix = "role:";
    inline constexpr std::string_view kRoomTaskPrefix = "task:";

    inline std::string role_room(std::string_view role_name) {
        return std::string(kRoomRolePrefix) + std::string(role_name);
    }

    inline std::string role_room(const AgentRole& role) {
        return role_room(protocol::role_name(role));
    }

    inline std::string task_room(std::string_view task_id) {
        return std::string(kRoomTaskPrefix) + std::string(task_id);
    }

}  // namespace evo::protocol::events
