#pragma once
#include <optional>
#include <string>

namespace toolsrv::protocol {

    // Error taxonomy reported to the orchestrator
    enum class ErrorCode {
        InvalidArgs,
        PermissionDenied,
        NotFound,
        Timeout,
        ExecutionError
    };

    // Where the output came from; the orchestrator uses it for trust decisions
    enum class Provenance {
        User,
        Web,
        Internal
    };

    // What every tool executor hands back
    struct ToolResult {
        bool ok = false;
        std::string output;
        std::optional<ErrorCode> error_code;
        bool retryable = false;
        Provenance provenance = Provenance::Internal;
        double duration_ms = 0.0;
        std::optional<double> cost;
    };

    inline std::string to_string(const ErrorCode code) {
        switch (code) {
            case ErrorCode::InvalidArgs:      return "invalid_args";
            case ErrorCode::PermissionDenied: return "permission_denied";
            case ErrorCode::NotFound:         return "not_found";
            case ErrorCode::Timeout:          return "timeout";
            case ErrorCode::ExecutionError:   return "execution_error";
            default: return "execution_error";
        }
    }

    inline std::string to_string(const Provenance provenance) {
        switch (provenance) {
            case Provenance::User:     return "user";
            case Provenance::Web:      return "web";
            case Provenance::Internal: return "internal";
            default: return "internal";
        }
    }

} // namespace toolsrv::protocol
