#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"

// Helpers shared by the executor translation units. Not part of the public API.
namespace toolsrv::tools::support {

using Clock = std::chrono::steady_clock;

inline double elapsed_ms(const Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

inline protocol::ToolResult success(std::string output, const Clock::time_point started,
                                    const protocol::Provenance provenance =
                                        protocol::Provenance::Internal) {
    protocol::ToolResult result;
    result.ok = true;
    result.output = std::move(output);
    result.retryable = false;
    result.provenance = provenance;
    result.duration_ms = elapsed_ms(started);
    return result;
}

inline protocol::ToolResult failure(const protocol::ErrorCode code, std::string output,
                                    const Clock::time_point started,
                                    const bool retryable = false) {
    protocol::ToolResult result;
    result.ok = false;
    result.output = std::move(output);
    result.error_code = code;
    result.retryable = retryable;
    result.provenance = protocol::Provenance::Internal;
    result.duration_ms = elapsed_ms(started);
    return result;
}

inline protocol::ErrorCode error_code_for(const core::errors::ErrorCategory category) {
    switch (category) {
        case core::errors::ErrorCategory::Input:
            return protocol::ErrorCode::InvalidArgs;
        case core::errors::ErrorCategory::Policy:
            return protocol::ErrorCode::PermissionDenied;
        case core::errors::ErrorCategory::NotFound:
            return protocol::ErrorCode::NotFound;
        case core::errors::ErrorCategory::Timeout:
            return protocol::ErrorCode::Timeout;
        case core::errors::ErrorCategory::Execution:
        case core::errors::ErrorCategory::Internal:
        default:
            return protocol::ErrorCode::ExecutionError;
    }
}

inline protocol::ToolResult from_error(const core::errors::ToolError& error,
                                       const Clock::time_point started) {
    std::string output = error.message;
    if (!error.hint.empty()) {
        output += " " + error.hint;
    }
    return failure(error_code_for(error.category), std::move(output), started,
                   error.category == core::errors::ErrorCategory::Timeout);
}

// Executors never let an exception cross their boundary.
template <typename Fn>
protocol::ToolResult guard_executor(const char* tool, Fn&& body) {
    const auto started = Clock::now();
    try {
        return body();
    } catch (const std::exception& error) {
        LOG_ERROR(std::string(tool) + " executor failed: " + error.what());
        return failure(protocol::ErrorCode::ExecutionError,
                       std::string(tool) + " failed: " + error.what(), started);
    }
}

// True when the first 512 bytes contain a NUL.
bool looks_binary(const std::string& bytes);

core::errors::Result<std::string> read_file_bytes(const std::filesystem::path& path);

struct WalkOptions {
    std::size_t max_entries = 0;  // 0 = unbounded
};

// Regular files below `root` as '/'-separated relative paths. Symlinks are not
// followed; node_modules and dot-directories are skipped.
std::vector<std::string> walk_files(const std::filesystem::path& root,
                                    const WalkOptions& options);

}  // namespace toolsrv::tools::support
