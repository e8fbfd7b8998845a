#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/codec/object_reader.hpp"
#include "core/codec/toml_document.hpp"
#include "core/errors/contract_errors.hpp"

namespace evo::core::codec {

// Runs `read` over the root table of a configuration document in strict
// mode. `read` takes an ObjectReader& and returns the decoded value; it must
// call finish() on every reader it opens. Decode failures come back as
// ErrorCategory::Config errors.
template <typename T, typename ReadFn>
errors::Result<T> decode_root(const nlohmann::json& root, const LocationIndex* locations,
                              ReadFn&& read) {
    try {
        ObjectReader reader(root, errors::ErrorCategory::Config, UnknownKeys::Reject, "",
                            locations);
        T value = read(reader);
        reader.finish();
        return value;
    } catch (const errors::ContractViolation& violation) {
        return violation.error();
    } catch (const nlohmann::json::exception& ex) {
        return errors::config_error(ex.what(), "invalid_type");
    }
}

template <typename T, typename ReadFn>
errors::Result<T> decode_toml_document(std::string_view text, ReadFn&& read) {
    auto parsed = parse_toml(text);
    if (errors::is_error(parsed)) {
        return errors::get_error(parsed);
    }
    const TomlDocument document = errors::take_value(std::move(parsed));
    return decode_root<T>(document.root, &document.locations, std::forward<ReadFn>(read));
}

template <typename T, typename ReadFn>
errors::Result<T> decode_json_document(std::string_view text, ReadFn&& read) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& ex) {
        return errors::config_error(ex.what(), "syntax_error");
    }
    return decode_root<T>(root, nullptr, std::forward<ReadFn>(read));
}

}  // namespace evo::core::codec
