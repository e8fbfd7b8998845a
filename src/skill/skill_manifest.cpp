#include "skill/skill_manifest.hpp"

#include "core/codec/document_decoder.hpp"
#include "core/codec/json_values.hpp"
#include "core/codec/object_reader.hpp"
#include "core/codec/toml_document.hpp"

namespace evo::skill {

using core::codec::ObjectReader;
using nlohmann::json;

namespace {

std::vector<SkillIO> read_io_list(ObjectReader& reader, const char* key) {
    std::vector<SkillIO> list;
    for (auto& entry : reader.object_list_or_empty(key)) {
        SkillIO io;
        io.name = entry.required_string("name");
        io.type = entry.required_string("type");
        io.required = entry.bool_or("required", false);
        io.description = entry.optional_string("description");
        entry.finish();
        list.push_back(std::move(io));
    }
    return list;
}

SkillManifest read_manifest(ObjectReader& reader) {
    SkillManifest manifest;
    manifest.name = reader.required_string("name");
    manifest.version = reader.required_string("version");
    manifest.description = reader.required_string("description");
    manifest.capabilities = reader.string_list_or_empty("capabilities");
    manifest.inputs = read_io_list(reader, "inputs");
    manifest.outputs = read_io_list(reader, "outputs");
    manifest.dependencies = reader.string_list_or_empty("dependencies");
    manifest.has_code = reader.bool_or("has_code", false);
    return manifest;
}

}  // namespace

bool operator==(const SkillIO& lhs, const SkillIO& rhs) {
    return lhs.name == rhs.name && lhs.type == rhs.type &&
           lhs.required == rhs.required && lhs.description == rhs.description;
}

bool operator==(const SkillManifest& lhs, const SkillManifest& rhs) {
    return lhs.name == rhs.name && lhs.version == rhs.version &&
           lhs.description == rhs.description &&
           lhs.capabilities == rhs.capabilities && lhs.inputs == rhs.inputs &&
           lhs.outputs == rhs.outputs && lhs.dependencies == rhs.dependencies &&
           lhs.has_code == rhs.has_code;
}

void to_json(json& j, const SkillIO& io) {
    j = json::object();
    j["name"] = io.name;
    j["type"] = io.type;
    j["required"] = io.required;
    j["description"] = core::codec::optional_to_json(io.description);
}

void to_json(json& j, const SkillManifest& manifest) {
    j = json::object();
    j["name"] = manifest.name;
    j["version"] = manifest.version;
    j["description"] = manifest.description;
    j["capabilities"] = manifest.capabilities;
    j["inputs"] = manifest.inputs;
    j["outputs"] = manifest.outputs;
    j["dependencies"] = manifest.dependencies;
    j["has_code"] = manifest.has_code;
}

Result<SkillManifest> parse_skill_manifest(const std::string_view text) {
    return core::codec::decode_toml_document<SkillManifest>(text, read_manifest);
}

std::string to_toml(const SkillManifest& manifest) {
    return core::codec::write_toml(json(manifest));
}

}  // namespace evo::skill
