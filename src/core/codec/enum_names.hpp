#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace evo::core::codec {

// Specialize next to each wire enum:
//
//   template <>
//   struct EnumNames<protocol::RunnerStatus> {
//       static constexpr std::array<std::pair<protocol::RunnerStatus, std::string_view>, 5>
//           entries{{...}};
//   };
//
// The table is the single source of truth for the enum's wire spelling.
template <typename Enum>
struct EnumNames;

template <typename Enum>
std::string_view enum_name(const Enum value) {
    for (const auto& [candidate, name] : EnumNames<Enum>::entries) {
        if (candidate == value) {
            return name;
        }
    }
    return "unknown";
}

template <typename Enum>
std::optional<Enum> enum_from_name(const std::string_view name) {
    for (const auto& [candidate, candidate_name] : EnumNames<Enum>::entries) {
        if (candidate_name == name) {
            return candidate;
        }
    }
    return std::nullopt;
}

// "`a`, `b`, `c`" for error messages
template <typename Enum>
std::string enum_name_list() {
    std::string out;
    for (const auto& entry : EnumNames<Enum>::entries) {
        if (!out.empty()) {
            out += ", ";
        }
        out += "`";
        out += entry.second;
        out += "`";
    }
    return out;
}

}  // namespace evo::core::codec
