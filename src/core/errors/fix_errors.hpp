#pragma once
#include <string>
#include <variant>

namespace eolfix::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., unknown CLI flag or missing flag value
        Config,     // E.g., --include and --exclude given together
        Io,         // E.g., permission denied while repairing a file
        Internal    // E.g., C++ logic bug
    };

    // The standardized error payload
    struct FixError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a FixError.
    template <typename T>
    using Result = std::variant<T, FixError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<FixError>(result);
    }

    template <typename T>
    const FixError& get_error(const Result<T>& result) {
        return std::get<FixError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Config:
                return "config";
            case ErrorCategory::Io:
                return "io";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace eolfix::core::errors
