#pragma once

#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "core/codec/object_reader.hpp"
#include "core/errors/contract_errors.hpp"

namespace evo::core::codec {

// A parsed TOML document. Tables become JSON objects and arrays keep their
// element order; `locations` maps every key's dotted path to where it was
// written so decoders can point at the offending line.
struct TomlDocument {
    nlohmann::json root = nlohmann::json::object();
    LocationIndex locations;
};

// Errors are reported as ErrorCategory::Config with a line/column.
errors::Result<TomlDocument> parse_toml(std::string_view text);

// Renders a JSON object as a TOML document: plain keys first, then
// [sub.tables], then [[arrays.of.tables]]. Null members are omitted since
// TOML has no null.
std::string write_toml(const nlohmann::json& table);

}  // namespace evo::core::codec
