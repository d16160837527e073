#pragma once
#include <string>
#include <variant>

namespace warden::core::errors {

    // 1. Typed error categories for everything that is not a policy verdict
    enum class ErrorCategory {
        Input,      // E.g., a missing or malformed CLI flag
        Config      // E.g., a policy file that cannot be parsed
    };

    // The standardized framework error payload
    struct GateError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Config:
                return "config";
            default:
                return "unknown";
        }
    }

    // 2. Propagation strategy (Result Object)
    // A Result holds either a successful value of type T, OR a GateError.
    template <typename T>
    using Result = std::variant<T, GateError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GateError>(result);
    }

    template <typename T>
    const GateError& get_error(const Result<T>& result) {
        return std::get<GateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

} // namespace warden::core::errors
