#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace evo::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Schema,    // A wire payload is missing a field or has the wrong type
        Config,    // A configuration or skill document could not be decoded
        Internal   // Process setup failed (e.g. the log directory)
    };

    // 1-based position inside a text document
    struct SourceLocation {
        std::size_t line = 0;
        std::size_t column = 0;
    };

    inline bool operator==(const SourceLocation& lhs, const SourceLocation& rhs) {
        return lhs.line == rhs.line && lhs.column == rhs.column;
    }

    // The standardized error payload
    struct ContractError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string path;                        // e.g. "providers[1].provider_type"
        std::optional<SourceLocation> location;  // best effort, documents only

        std::string describe() const {
            std::string text = message;
            if (!path.empty()) {
                text += " (field `" + path + "`)";
            }
            if (location.has_value()) {
                text += " at line " + std::to_string(location->line) +
                        ", column " + std::to_string(location->column);
            }
            return text;
        }
    };

    inline ContractError schema_error(std::string message, std::string code,
                                      std::string path = "") {
        return ContractError{ErrorCategory::Schema, std::move(message),
                             std::move(code), std::move(path), std::nullopt};
    }

    inline ContractError config_error(std::string message, std::string code,
                                      std::string path = "",
                                      std::optional<SourceLocation> location = std::nullopt) {
        return ContractError{ErrorCategory::Config, std::move(message),
                             std::move(code), std::move(path), location};
    }

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a ContractError.
    template <typename T>
    using Result = std::variant<T, ContractError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ContractError>(result);
    }

    template <typename T>
    const ContractError& get_error(const Result<T>& result) {
        return std::get<ContractError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    // 3. Decoders raise this internally; public parse functions catch it at
    // their boundary and hand the carried error back as a Result.
    class ContractViolation : public std::runtime_error {
    public:
        explicit ContractViolation(ContractError error)
            : std::runtime_error(error.describe()), error_(std::move(error)) {}

        const ContractError& error() const noexcept { return error_; }

    private:
        ContractError error_;
    };

} // namespace evo::core::errors
