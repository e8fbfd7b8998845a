#include "protocol/memory_messages.hpp"

#include <limits>
#include "core/codec/json_values.hpp"

namespace evo::protocol {

using core::codec::enum_to_json;
using core::codec::ObjectReader;
using core::codec::optional_enum_to_json;
using core::codec::optional_to_json;
using nlohmann::json;

namespace {

template <typename T>
std::vector<T> read_list(ObjectReader& reader, const char* key) {
    std::vector<T> items;
    for (auto& entry : reader.object_list_or_empty(key)) {
        T item;
        read_fields(entry, item);
        items.push_back(std::move(item));
    }
    return items;
}

}  // namespace

bool operator==(const MemoryTierEntry& lhs, const MemoryTierEntry& rhs) {
    return lhs.tier == rhs.tier && lhs.content == rhs.content;
}

bool operator==(const MemoryStore& lhs, const MemoryStore& rhs) {
    return lhs.scope == rhs.scope && lhs.category == rhs.category &&
           lhs.key == rhs.key && lhs.metadata == rhs.metadata &&
           lhs.tags == rhs.tags && lhs.agent_id == rhs.agent_id &&
           lhs.run_id == rhs.run_id && lhs.skill_id == rhs.skill_id &&
           lhs.relevance_score == rhs.relevance_score && lhs.tiers == rhs.tiers &&
           lhs.task_id == rhs.task_id;
}

bool operator==(const MemoryQuery& lhs, const MemoryQuery& rhs) {
    return lhs.query == rhs.query && lhs.scope == rhs.scope &&
           lhs.category == rhs.category && lhs.agent_id == rhs.agent_id &&
           lhs.tier == rhs.tier && lhs.task_id == rhs.task_id &&
           lhs.limit == rhs.limit;
}

bool operator==(const MemoryTierRecord& lhs, const MemoryTierRecord& rhs) {
    return lhs.id == rhs.id && lhs.memory_id == rhs.memory_id &&
           lhs.tier == rhs.tier && lhs.content == rhs.content &&
           lhs.created_at == rhs.created_at && lhs.updated_at == rhs.updated_at;
}

bool operator==(const MemoryRecord& lhs, const MemoryRecord& rhs) {
    return lhs.id == rhs.id && lhs.scope == rhs.scope &&
           lhs.category == rhs.category && lhs.key == rhs.key &&
           lhs.tiers == rhs.tiers && lhs.metadata == rhs.metadata &&
           lhs.tags == rhs.tags && lhs.agent_id == rhs.agent_id &&
           lhs.run_id == rhs.run_id && lhs.skill_id == rhs.skill_id &&
           lhs.relevance_score == rhs.relevance_score &&
           lhs.access_count == rhs.access_count &&
           lhs.created_at == rhs.created_at && lhs.updated_at == rhs.updated_at;
}

bool operator==(const MemoryResult& lhs, const MemoryResult& rhs) {
    return lhs.memories == rhs.memories && lhs.count == rhs.count;
}

bool operator==(const MemoryChanged& lhs, const MemoryChanged& rhs) {
    return lhs.action == rhs.action && lhs.memory == rhs.memory &&
           lhs.memory_id == rhs.memory_id;
}

void to_json(json& j, const MemoryTierEntry& message) {
    j = json::object();
    j["tier"] = message.tier;
    j["content"] = message.content;
}

void to_json(json& j, const MemoryStore& message) {
    j = json::object();
    j["scope"] = enum_to_json(message.scope);
    j["category"] = enum_to_json(message.category);
    j["key"] = message.key;
    j["metadata"] = message.metadata;
    j["tags"] = message.tags;
    j["agent_id"] = message.agent_id;
    j["run_id"] = message.run_id;
    j["skill_id"] = message.skill_id;
    j["relevance_score"] = message.relevance_score;
    j["tiers"] = message.tiers;
    j["task_id"] = optional_to_json(message.task_id);
}

void to_json(json& j, const MemoryQuery& message) {
    j = json::object();
    j["query"] = message.query;
    j["scope"] = optional_enum_to_json(message.scope);
    j["category"] = optional_enum_to_json(message.category);
    j["agent_id"] = optional_to_json(message.agent_id);
    j["tier"] = optional_to_json(message.tier);
    j["task_id"] = optional_to_json(message.task_id);
    j["limit"] = message.limit;
}

void to_json(json& j, const MemoryTierRecord& message) {
    j = json::object();
    j["id"] = message.id;
    j["memory_id"] = message.memory_id;
    j["tier"] = message.tier;
    j["content"] = message.content;
    j["created_at"] = message.created_at;
    j["updated_at"] = message.updated_at;
}

void to_json(json& j, const MemoryRecord& message) {
    j = json::object();
    j["id"] = message.id;
    j["scope"] = message.scope;
    j["category"] = message.category;
    j["key"] = message.key;
    j["tiers"] = message.tiers;
    j["metadata"] = message.metadata;
    j["tags"] = message.tags;
    j["agent_id"] = message.agent_id;
    j["run_id"] = message.run_id;
    j["skill_id"] = message.skill_id;
    j["relevance_score"] = message.relevance_score;
    j["access_count"] = message.access_count;
    j["created_at"] = message.created_at;
    j["updated_at"] = message.updated_at;
}

void to_json(json& j, const MemoryResult& message) {
    j = json::object();
    j["memories"] = message.memories;
    j["count"] = message.count;
}

void to_json(json& j, const MemoryChanged& message) {
    j = json::object();
    j["action"] = message.action;
    j["memory"] = optional_to_json(message.memory);
    j["memory_id"] = optional_to_json(message.memory_id);
}

void read_fields(ObjectReader& reader, MemoryTierEntry& out) {
    out.tier = reader.required_string("tier");
    out.content = reader.required_string("content");
}

void read_fields(ObjectReader& reader, MemoryStore& out) {
    out.scope = reader.required_enum<MemoryScope>("scope");
    out.category = reader.required_enum<MemoryCategory>("category");
    out.key = reader.string_or("key", "");
    out.metadata = reader.value_or("metadata", json::object());
    out.tags = reader.string_list_or_empty("tags");
    out.agent_id = reader.string_or("agent_id", "");
    out.run_id = reader.string_or("run_id", "");
    out.skill_id = reader.string_or("skill_id", "");
    out.relevance_score = reader.number_or("relevance_score", 0.0);
    out.tiers = read_list<MemoryTierEntry>(reader, "tiers");
    out.task_id = reader.optional_string("task_id");
}

void read_fields(ObjectReader& reader, MemoryQuery& out) {
    out.query = reader.required_string("query");
    out.scope = reader.optional_enum<MemoryScope>("scope");
    out.category = reader.optional_enum<MemoryCategory>("category");
    out.agent_id = reader.optional_string("agent_id");
    out.tier = reader.optional_string("tier");
    out.task_id = reader.optional_string("task_id");
    out.limit = static_cast<std::uint32_t>(reader.unsigned_or(
        "limit", kDefaultMemoryQueryLimit, std::numeric_limits<std::uint32_t>::max()));
}

void read_fields(ObjectReader& reader, MemoryTierRecord& out) {
    out.id = reader.required_string("id");
    out.memory_id = reader.required_string("memory_id");
    out.tier = reader.required_string("tier");
    out.content = reader.required_string("content");
    out.created_at = reader.required_string("created_at");
    out.updated_at = reader.required_string("updated_at");
}

void read_fields(ObjectReader& reader, MemoryRecord& out) {
    out.id = reader.required_string("id");
    out.scope = reader.required_string("scope");
    out.category = reader.required_string("category");
    out.key = reader.required_string("key");
    out.tiers = read_list<MemoryTierRecord>(reader, "tiers");
    out.metadata = reader.value_or("metadata", json::object());
    out.tags = reader.string_list_or_empty("tags");
    out.agent_id = reader.string_or("agent_id", "");
    out.run_id = reader.string_or("run_id", "");
    out.skill_id = reader.string_or("skill_id", "");
    out.relevance_score = reader.number_or("relevance_score", 0.0);
    out.access_count = reader.integer_or("access_count", 0);
    out.created_at = reader.required_string("created_at");
    out.updated_at = reader.required_string("updated_at");
}

void read_fields(ObjectReader& reader, MemoryResult& out) {
    out.memories.clear();
    for (auto& entry : reader.required_object_list("memories")) {
        MemoryRecord record;
        read_fields(entry, record);
        out.memories.push_back(std::move(record));
    }
    out.count = static_cast<std::uint32_t>(
        reader.required_unsigned("count", std::numeric_limits<std::uint32_t>::max()));
}

void read_fields(ObjectReader& reader, MemoryChanged& out) {
    out.action = reader.required_string("action");
    out.memory.reset();
    if (auto memory = reader.optional_object("memory")) {
        MemoryRecord record;
        read_fields(*memory, record);
        out.memory = std::move(record);
    }
    out.memory_id = reader.optional_string("memory_id");
}

}  // namespace evo::protocol
