#include "protocol/status_contract.hpp"

namespace evo::protocol {

using core::codec::ObjectReader;
using nlohmann::json;

namespace {

constexpr const char* kSuccessTag = "success";
constexpr const char* kFailureTag = "failure";
constexpr const char* kPartialTag = "partial";

}  // namespace

json skill_result_to_json(const SkillResult& result) {
    if (std::holds_alternative<SkillSuccess>(result)) {
        return kSuccessTag;
    }
    json tagged = json::object();
    if (const auto* failure = std::get_if<SkillFailure>(&result)) {
        tagged[kFailureTag] = failure->message;
    } else {
        tagged[kPartialTag] = std::get<SkillPartial>(result).message;
    }
    return tagged;
}

SkillResult read_skill_result(ObjectReader& reader, const char* key) {
    const json& value = reader.require(key);
    if (value.is_string()) {
        if (value.get_ref<const std::string&>() != kSuccessTag) {
            reader.fail(key, "unknown_variant",
                        "unknown variant `" + value.get<std::string>() +
                            "`, expected `success`, {\"failure\": ..} or {\"partial\": ..}");
        }
        return SkillSuccess{};
    }
    if (!value.is_object()) {
        reader.fail_type(key, "string or object", value);
    }
    if (value.size() != 1) {
        reader.fail(key, "unknown_variant",
                    "tagged skill result must be a single-key object");
    }
    const auto tag = value.begin();
    const std::string tag_path = std::string(key) + "." + tag.key();
    if (tag.key() == kFailureTag || tag.key() == kPartialTag) {
        if (!tag.value().is_string()) {
            reader.fail_type(tag_path, "string", tag.value());
        }
        auto message = tag.value().get<std::string>();
        if (tag.key() == kFailureTag) {
            return SkillFailure{std::move(message)};
        }
        return SkillPartial{std::move(message)};
    }
    reader.fail(key, "unknown_variant",
                "unknown variant `" + tag.key() +
                    "`, expected `success`, `failure` or `partial`");
}

}  // namespace evo::protocol
