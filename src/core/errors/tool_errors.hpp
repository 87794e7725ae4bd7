#pragma once
#include <string>
#include <variant>

namespace toolsrv::core::errors {

    // 1. Typed error categories, one per way a tool call can go wrong
    enum class ErrorCategory {
        Input,      // E.g., missing "path" argument or an invalid regex
        Policy,     // E.g., command outside the allowlist, path outside the roots
        NotFound,   // E.g., file to read or patch does not exist
        Timeout,    // E.g., shell command exceeded its wall-clock budget
        Execution,  // E.g., shell command exited non-zero
        Internal    // E.g., fork failed or an unexpected exception escaped
    };

    // The standardized error payload
    struct ToolError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Corrective suggestion for the caller
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a ToolError.
    template <typename T>
    using Result = std::variant<T, ToolError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolError>(result);
    }

    template <typename T>
    const ToolError& get_error(const Result<T>& result) {
        return std::get<ToolError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::NotFound:  return "not_found";
            case ErrorCategory::Timeout:   return "timeout";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace toolsrv::core::errors
