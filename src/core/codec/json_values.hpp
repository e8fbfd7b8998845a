#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/codec/enum_names.hpp"

namespace evo::core::codec {

// Absent optionals are written as an explicit null so that every encoding
// of a message carries the same key set.
template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return nlohmann::json(*value);
}

template <typename Enum>
nlohmann::json enum_to_json(const Enum value) {
    return std::string(enum_name(value));
}

template <typename Enum>
nlohmann::json optional_enum_to_json(const std::optional<Enum>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return enum_to_json(*value);
}

}  // namespace evo::core::codec
