#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"
#include "core/errors/contract_errors.hpp"

namespace evo::core::codec {

// Dotted field path ("providers[0].rate_limit.burst_size") -> where the key
// was written in the source document.
using LocationIndex = std::map<std::string, errors::SourceLocation>;

enum class UnknownKeys {
    Ignore,  // wire payloads: newer peers may add fields
    Reject   // documents: a typo is an operator error
};

// Typed, path-aware access to one JSON object. Every failure throws
// errors::ContractViolation tagged with the reader's category, the dotted
// path of the offending field and, when a LocationIndex is attached, the
// line/column it came from.
class ObjectReader {
public:
    ObjectReader(const nlohmann::json& object, errors::ErrorCategory category,
                 UnknownKeys unknown_keys, std::string path = "",
                 const LocationIndex* locations = nullptr);

    // Present and not null.
    bool has(const char* key) const;

    std::string required_string(const char* key);
    std::optional<std::string> optional_string(const char* key);
    std::string string_or(const char* key, std::string fallback);

    bool required_bool(const char* key);
    bool bool_or(const char* key, bool fallback);

    std::uint64_t required_unsigned(
        const char* key,
        std::uint64_t max = std::numeric_limits<std::uint64_t>::max());
    std::optional<std::uint64_t> optional_unsigned(
        const char* key,
        std::uint64_t max = std::numeric_limits<std::uint64_t>::max());
    std::uint64_t unsigned_or(
        const char* key, std::uint64_t fallback,
        std::uint64_t max = std::numeric_limits<std::uint64_t>::max());

    std::optional<std::int64_t> optional_integer(
        const char* key,
        std::int64_t min = std::numeric_limits<std::int64_t>::min(),
        std::int64_t max = std::numeric_limits<std::int64_t>::max());
    std::int64_t integer_or(const char* key, std::int64_t fallback);

    std::optional<double> optional_number(const char* key);
    double number_or(const char* key, double fallback);

    std::vector<std::string> required_string_list(const char* key);
    std::vector<std::string> string_list_or_empty(const char* key);

    std::map<std::string, std::string> string_map_or_empty(const char* key);
    std::map<std::string, nlohmann::json> required_value_map(const char* key);

    // Any JSON value; a missing key yields the fallback.
    nlohmann::json value_or(const char* key, nlohmann::json fallback);
    std::optional<nlohmann::json> optional_value(const char* key);
    // Any JSON object, taken verbatim without key checks.
    nlohmann::json object_value_or_empty(const char* key);

    ObjectReader required_object(const char* key);
    std::optional<ObjectReader> optional_object(const char* key);
    std::vector<ObjectReader> required_object_list(const char* key);
    std::vector<ObjectReader> object_list_or_empty(const char* key);

    template <typename Enum>
    Enum required_enum(const char* key) {
        return to_enum<Enum>(key, require(key));
    }

    template <typename Enum>
    std::optional<Enum> optional_enum(const char* key) {
        const nlohmann::json* value = find(key);
        if (value == nullptr || value->is_null()) {
            return std::nullopt;
        }
        return to_enum<Enum>(key, *value);
    }

    template <typename Enum>
    Enum enum_or(const char* key, const Enum fallback) {
        const auto value = optional_enum<Enum>(key);
        return value.has_value() ? *value : fallback;
    }

    // Raw lookup for hand-written variant decoding. Marks the key as read;
    // returns nullptr when the key is absent.
    const nlohmann::json* find(const char* key);
    const nlohmann::json& require(const char* key);

    [[noreturn]] void fail(std::string_view key, const std::string& code,
                           const std::string& message) const;
    [[noreturn]] void fail_type(std::string_view key, const char* expected,
                                const nlohmann::json& found) const;

    std::string child_path(std::string_view key) const;
    const std::string& path() const { return path_; }

    // Under UnknownKeys::Reject, throws for the first key that none of the
    // accessors above asked for. No-op under UnknownKeys::Ignore.
    void finish() const;

private:
    template <typename Enum>
    Enum to_enum(const char* key, const nlohmann::json& value) const {
        if (!value.is_string()) {
            fail_type(key, "string", value);
        }
        const auto& name = value.get_ref<const std::string&>();
        const auto parsed = enum_from_name<Enum>(name);
        if (!parsed.has_value()) {
            fail(key, "unknown_variant",
                 "unknown variant `" + name + "`, expected one of " +
                     enum_name_list<Enum>());
        }
        return *parsed;
    }

    ObjectReader child(const nlohmann::json& value, std::string path) const;
    std::vector<ObjectReader> object_list(const char* key,
                                          const nlohmann::json& value) const;
    std::optional<errors::SourceLocation> locate(const std::string& path) const;

    const nlohmann::json& object_;
    errors::ErrorCategory category_;
    UnknownKeys unknown_keys_;
    std::string path_;
    const LocationIndex* locations_;
    std::set<std::string> consumed_;
};

}  // namespace evo::core::codec
