#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"
#include "core/codec/object_reader.hpp"

namespace evo::protocol {

    inline constexpr std::uint32_t kDefaultMemoryQueryLimit = 20;

    enum class MemoryScope {
        System,
        Agent,
        Pipeline,
        Skill
    };

    enum class MemoryCategory {
        Case,
        Pattern,
        Fact,
        Preference,
        Resource,
        Event
    };

    // One detail tier ("l0", "l1", "l2") of a memory being written.
    struct MemoryTierEntry {
        std::string tier;
        std::string content;
    };

    // memory:store
    struct MemoryStore {
        MemoryScope scope = MemoryScope::Agent;
        MemoryCategory category = MemoryCategory::Fact;
        std::string key;
        nlohmann::json metadata = nlohmann::json::object();
        std::vector<std::string> tags;
        std::string agent_id;
        std::string run_id;
        std::string skill_id;
        double relevance_score = 0.0;
        std::vector<MemoryTierEntry> tiers;
        std::optional<std::string> task_id;
    };

    // memory:query
    struct MemoryQuery {
        std::string query;
        std::optional<MemoryScope> scope;
        std::optional<MemoryCategory> category;
        std::optional<std::string> agent_id;
        std::optional<std::string> tier;
        std::optional<std::string> task_id;
        std::uint32_t limit = kDefaultMemoryQueryLimit;
    };

    struct MemoryTierRecord {
        std::string id;
        std::string memory_id;
        std::string tier;
        std::string content;
        std::string created_at;
        std::string updated_at;
    };

    // A stored memory as the king returns it. Scope and category come back
    // as the store's strings.
    struct MemoryRecord {
        std::string id;
        std::string scope;
        std::string category;
        std::string key;
        std::vector<MemoryTierRecord> tiers;
        nlohmann::json metadata = nlohmann::json::object();
        std::vector<std::string> tags;
        std::string agent_id;
        std::string run_id;
        std::string skill_id;
        double relevance_score = 0.0;
        std::int64_t access_count = 0;
        std::string created_at;
        std::string updated_at;
    };

    // Reply to memory:query
    struct MemoryResult {
        std::vector<MemoryRecord> memories;
        std::uint32_t count = 0;
    };

    // memory:changed, broadcast after a create, update or delete
    struct MemoryChanged {
        std::string action;
        std::optional<MemoryRecord> memory;
        std::optional<std::string> memory_id;
    };

    bool operator==(const MemoryTierEntry& lhs, const MemoryTierEntry& rhs);
    bool operator==(const MemoryStore& lhs, const MemoryStore& rhs);
    bool operator==(const MemoryQuery& lhs, const MemoryQuery& rhs);
    bool operator==(const MemoryTierRecord& lhs, const MemoryTierRecord& rhs);
    bool operator==(const MemoryRecord& lhs, const MemoryRecord& rhs);
    bool operator==(const MemoryResult& lhs, const MemoryResult& rhs);
    bool operator==(const MemoryChanged& lhs, const MemoryChanged& rhs);

    void to_json(nlohmann::json& j, const MemoryTierEntry& message);
    void to_json(nlohmann::json& j, const MemoryStore& message);
    void to_json(nlohmann::json& j, const MemoryQuery& message);
    void to_json(nlohmann::json& j, const MemoryTierRecord& message);
    void to_json(nlohmann::json& j, const MemoryRecord& message);
    void to_json(nlohmann::json& j, const MemoryResult& message);
    void to_json(nlohmann::json& j, const MemoryChanged& message);

    void read_fields(core::codec::ObjectReader& reader, MemoryTierEntry& out);
    void read_fields(core::codec::ObjectReader& reader, MemoryStore& out);
    void read_fields(core::codec::ObjectReader& reader, MemoryQuery& out);
    void read_fields(core::codec::ObjectReader& reader, MemoryTierRecord& out);
    void read_fields(core::codec::ObjectReader& reader, MemoryRecord& out);
    void read_fields(core::codec::ObjectReader& reader, MemoryResult& out);
    void read_fields(core::codec::ObjectReader& reader, MemoryChanged& out);

}  // namespace evo::protocol

namespace evo::core::codec {

template <>
struct EnumNames<protocol::MemoryScope> {
    static constexpr std::array<std::pair<protocol::MemoryScope, std::string_view>, 4>
        entries{{
            {protocol::MemoryScope::System, "system"},
            {protocol::MemoryScope::Agent, "agent"},
            {protocol::MemoryScope::Pipeline, "pipeline"},
            {protocol::MemoryScope::Skill, "skill"},
        }};
};

template <>
struct EnumNames<protocol::MemoryCategory> {
    static constexpr std::array<std::pair<protocol::MemoryCategory, std::string_view>, 6>
        entries{{
            {protocol::MemoryCategory::Case, "case"},
            {protocol::MemoryCategory::Pattern, "pattern"},
            {protocol::MemoryCategory::Fact, "fact"},
            {protocol::MemoryCategory::Preference, "preference"},
            {protocol::MemoryCategory::Resource, "resource"},
            {protocol::MemoryCategory::Event, "event"},
        }};
};

}  // namespace evo::core::codec
