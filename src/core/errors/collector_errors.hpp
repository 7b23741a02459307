#pragma once
#include <string>
#include <variant>

namespace diagcollect::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,         // E.g., unknown CLI flag or malformed config file
        Precondition,  // E.g., not elevated, output root not writable
        Execution,     // E.g., an external export tool could not be launched
        Internal       // E.g., pipe/fork failure or a logic bug
    };

    // The standardized error payload
    struct CollectorError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a CollectorError.
    template <typename T>
    using Result = std::variant<T, CollectorError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<CollectorError>(result);
    }

    template <typename T>
    const CollectorError& get_error(const Result<T>& result) {
        return std::get<CollectorError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:        return "input";
            case ErrorCategory::Precondition: return "precondition";
            case ErrorCategory::Execution:    return "execution";
            case ErrorCategory::Internal:     return "internal";
            default:                          return "unknown";
        }
    }

} // namespace diagcollect::core::errors
