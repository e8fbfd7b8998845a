#pragma once

#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "core/codec/object_reader.hpp"
#include "core/errors/contract_errors.hpp"

namespace evo::protocol {

    using core::errors::Result;

    // Compact JSON text of a message. nlohmann objects keep their keys
    // sorted, so equal messages always produce byte-identical text.
    template <typename Message>
    std::string encode(const Message& message) {
        return nlohmann::json(message).dump();
    }

    // Decodes an already parsed payload. Unknown extra fields are ignored;
    // a missing or mistyped field yields a Schema error naming its path.
    template <typename Message>
    Result<Message> decode_value(const nlohmann::json& payload) {
        try {
            core::codec::ObjectReader reader(payload, core::errors::ErrorCategory::Schema,
                                             core::codec::UnknownKeys::Ignore);
            Message message;
            read_fields(reader, message);
            return message;
        } catch (const core::errors::ContractViolation& violation) {
            return violation.error();
        } catch (const nlohmann::json::exception& ex) {
            return core::errors::schema_error(ex.what(), "invalid_type");
        }
    }

    template <typename Message>
    Result<Message> decode(std::string_view text) {
        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(text.begin(), text.end());
        } catch (const nlohmann::json::parse_error& ex) {
            return core::errors::schema_error(ex.what(), "invalid_json");
        }
        return decode_value<Message>(payload);
    }

}  // namespace evo::protocol
