#include "core/codec/object_reader.hpp"

#include <utility>

namespace evo::core::codec {

using errors::ContractError;
using errors::ContractViolation;
using nlohmann::json;

namespace {

std::string strip_index_suffix(const std::string& path) {
    if (path.empty() || path.back() != ']') {
        return path;
    }
    const auto open = path.rfind('[');
    return open == std::string::npos ? path : path.substr(0, open);
}

}  // namespace

ObjectReader::ObjectReader(const json& object, const errors::ErrorCategory category,
                           const UnknownKeys unknown_keys, std::string path,
                           const LocationIndex* locations)
    : object_(object),
      category_(category),
      unknown_keys_(unknown_keys),
      path_(std::move(path)),
      locations_(locations) {
    if (!object_.is_object()) {
        const std::string subject = path_.empty() ? "payload" : "`" + path_ + "`";
        fail("", "expected_object",
             subject + " must be an object, found " + object_.type_name());
    }
}

std::string ObjectReader::child_path(const std::string_view key) const {
    if (key.empty()) {
        return path_;
    }
    if (path_.empty()) {
        return std::string(key);
    }
    return path_ + "." + std::string(key);
}

std::optional<errors::SourceLocation> ObjectReader::locate(
    const std::string& path) const {
    if (locations_ == nullptr) {
        return std::nullopt;
    }
    std::string candidate = path;
    while (true) {
        const auto it = locations_->find(candidate);
        if (it != locations_->end()) {
            return it->second;
        }
        const std::string stripped = strip_index_suffix(candidate);
        if (stripped == candidate) {
            break;
        }
        candidate = stripped;
    }
    if (path != path_) {
        return locate(path_);
    }
    return std::nullopt;
}

void ObjectReader::fail(const std::string_view key, const std::string& code,
                        const std::string& message) const {
    const std::string field = child_path(key);
    throw ContractViolation(
        ContractError{category_, message, code, field, locate(field)});
}

void ObjectReader::fail_type(const std::string_view key, const char* expected,
                             const json& found) const {
    const std::string field = child_path(key);
    const std::string subject = field.empty() ? "payload" : "`" + field + "`";
    fail(key, "invalid_type",
         "invalid type for " + subject + ": expected " + expected + ", found " +
             found.type_name());
}

bool ObjectReader::has(const char* key) const {
    const auto it = object_.find(key);
    return it != object_.end() && !it->is_null();
}

const json* ObjectReader::find(const char* key) {
    consumed_.insert(key);
    const auto it = object_.find(key);
    if (it == object_.end()) {
        return nullptr;
    }
    return &(*it);
}

const json& ObjectReader::require(const char* key) {
    const json* value = find(key);
    if (value == nullptr) {
        fail(key, "missing_field", "missing field `" + child_path(key) + "`");
    }
    return *value;
}

std::string ObjectReader::required_string(const char* key) {
    const json& value = require(key);
    if (!value.is_string()) {
        fail_type(key, "string", value);
    }
    return value.get<std::string>();
}

std::optional<std::string> ObjectReader::optional_string(const char* key) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        fail_type(key, "string", *value);
    }
    return value->get<std::string>();
}

std::string ObjectReader::string_or(const char* key, std::string fallback) {
    auto value = optional_string(key);
    return value.has_value() ? std::move(*value) : std::move(fallback);
}

bool ObjectReader::required_bool(const char* key) {
    const json& value = require(key);
    if (!value.is_boolean()) {
        fail_type(key, "boolean", value);
    }
    return value.get<bool>();
}

bool ObjectReader::bool_or(const char* key, const bool fallback) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return fallback;
    }
    if (!value->is_boolean()) {
        fail_type(key, "boolean", *value);
    }
    return value->get<bool>();
}

std::uint64_t ObjectReader::required_unsigned(const char* key,
                                              const std::uint64_t max) {
    require(key);
    const auto value = optional_unsigned(key, max);
    if (!value.has_value()) {
        fail(key, "invalid_type",
             "invalid type for `" + child_path(key) +
                 "`: expected unsigned integer, found null");
    }
    return *value;
}

std::optional<std::uint64_t> ObjectReader::optional_unsigned(
    const char* key, const std::uint64_t max) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_number_integer()) {
        fail_type(key, "unsigned integer", *value);
    }
    std::uint64_t number = 0;
    if (value->is_number_unsigned()) {
        number = value->get<std::uint64_t>();
    } else {
        const auto signed_number = value->get<std::int64_t>();
        if (signed_number < 0) {
            fail(key, "out_of_range",
                 "`" + child_path(key) + "` must not be negative, found " +
                     std::to_string(signed_number));
        }
        number = static_cast<std::uint64_t>(signed_number);
    }
    if (number > max) {
        fail(key, "out_of_range",
             "`" + child_path(key) + "` is out of range: " + std::to_string(number) +
                 " exceeds " + std::to_string(max));
    }
    return number;
}

std::uint64_t ObjectReader::unsigned_or(const char* key, const std::uint64_t fallback,
                                        const std::uint64_t max) {
    const auto value = optional_unsigned(key, max);
    return value.has_value() ? *value : fallback;
}

std::optional<std::int64_t> ObjectReader::optional_integer(const char* key,
                                                           const std::int64_t min,
                                                           const std::int64_t max) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_number_integer()) {
        fail_type(key, "integer", *value);
    }
    if (value->is_number_unsigned() &&
        value->get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        fail(key, "out_of_range", "`" + child_path(key) + "` is out of range");
    }
    const auto number = value->get<std::int64_t>();
    if (number < min || number > max) {
        fail(key, "out_of_range",
             "`" + child_path(key) + "` is out of range: " + std::to_string(number));
    }
    return number;
}

std::int64_t ObjectReader::integer_or(const char* key, const std::int64_t fallback) {
    const auto value = optional_integer(key);
    return value.has_value() ? *value : fallback;
}

std::optional<double> ObjectReader::optional_number(const char* key) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_number()) {
        fail_type(key, "number", *value);
    }
    return value->get<double>();
}

double ObjectReader::number_or(const char* key, const double fallback) {
    const auto value = optional_number(key);
    return value.has_value() ? *value : fallback;
}

std::vector<std::string> ObjectReader::required_string_list(const char* key) {
    const json& value = require(key);
    if (!value.is_array()) {
        fail_type(key, "array of strings", value);
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const json& item = value[i];
        if (!item.is_string()) {
            fail_type(std::string(key) + "[" + std::to_string(i) + "]", "string",
                      item);
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::vector<std::string> ObjectReader::string_list_or_empty(const char* key) {
    if (!has(key)) {
        consumed_.insert(key);
        return {};
    }
    return required_string_list(key);
}

std::map<std::string, std::string> ObjectReader::string_map_or_empty(
    const char* key) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return {};
    }
    if (!value->is_object()) {
        fail_type(key, "table of strings", *value);
    }
    std::map<std::string, std::string> out;
    for (const auto& item : value->items()) {
        if (!item.value().is_string()) {
            fail_type(std::string(key) + "." + item.key(), "string", item.value());
        }
        out.emplace(item.key(), item.value().get<std::string>());
    }
    return out;
}

std::map<std::string, json> ObjectReader::required_value_map(const char* key) {
    const json& value = require(key);
    if (!value.is_object()) {
        fail_type(key, "object", value);
    }
    std::map<std::string, json> out;
    for (const auto& item : value.items()) {
        out.emplace(item.key(), item.value());
    }
    return out;
}

json ObjectReader::value_or(const char* key, json fallback) {
    const json* value = find(key);
    return value == nullptr ? std::move(fallback) : *value;
}

std::optional<json> ObjectReader::optional_value(const char* key) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    return *value;
}

json ObjectReader::object_value_or_empty(const char* key) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return json::object();
    }
    if (!value->is_object()) {
        fail_type(key, "object", *value);
    }
    return *value;
}

ObjectReader ObjectReader::child(const json& value, std::string path) const {
    return ObjectReader(value, category_, unknown_keys_, std::move(path), locations_);
}

ObjectReader ObjectReader::required_object(const char* key) {
    const json& value = require(key);
    if (!value.is_object()) {
        fail_type(key, "object", value);
    }
    return child(value, child_path(key));
}

std::optional<ObjectReader> ObjectReader::optional_object(const char* key) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_object()) {
        fail_type(key, "object", *value);
    }
    return child(*value, child_path(key));
}

std::vector<ObjectReader> ObjectReader::object_list(const char* key,
                                                    const json& value) const {
    if (!value.is_array()) {
        fail_type(key, "array of objects", value);
    }
    std::vector<ObjectReader> out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const json& item = value[i];
        const std::string element = std::string(key) + "[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            fail_type(element, "object", item);
        }
        out.push_back(child(item, child_path(element)));
    }
    return out;
}

std::vector<ObjectReader> ObjectReader::required_object_list(const char* key) {
    return object_list(key, require(key));
}

std::vector<ObjectReader> ObjectReader::object_list_or_empty(const char* key) {
    const json* value = find(key);
    if (value == nullptr || value->is_null()) {
        return {};
    }
    return object_list(key, *value);
}

void ObjectReader::finish() const {
    if (unknown_keys_ == UnknownKeys::Ignore) {
        return;
    }
    for (const auto& item : object_.items()) {
        if (consumed_.count(item.key()) == 0) {
            fail(item.key(), "unknown_key",
                 "unknown field `" + child_path(item.key()) + "`");
        }
    }
}

}  // namespace evo::core::codec
