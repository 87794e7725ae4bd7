#include "tools/tool_host.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <regex>
#include <type_traits>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/shell_runner.hpp"
#include "tools/tool_support.hpp"

namespace toolsrv::tools {

using protocol::ErrorCode;
using protocol::Provenance;
using protocol::ToolResult;
using support::Clock;

namespace {

constexpr const char kNetworkEmptyMessage[] =
    "Network request returned empty response. The target domain may not be in the "
    "allowed domains list. Use ask_user to request access to additional domains.";
constexpr const char kNetworkHint[] =
    "\nNote: The domain may not be in the allowed list. Use ask_user to request access "
    "to additional domains.";

bool looks_like_network_failure(const std::string& text) {
    static const std::regex kPattern("resolve|refused|reset|unreachable|network",
                                     std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(text, kPattern);
}

}  // namespace

ToolHost::ToolHost(core::config::ServerConfig config, const policy::PathResolver& resolver,
                   const session::CredentialVault& vault,
                   policy::PipelineValidator validator)
    : config_(std::move(config)),
      resolver_(resolver),
      vault_(vault),
      validator_(std::move(validator)) {}

ToolResult ToolHost::execute(const ToolCall& call,
                             const std::uint32_t request_timeout_ms) const {
    return std::visit(
        [this, request_timeout_ms](const auto& args) -> ToolResult {
            using T = std::decay_t<decltype(args)>;
            if constexpr (std::is_same_v<T, BashArgs>) {
                return run_bash(args, request_timeout_ms);
            } else if constexpr (std::is_same_v<T, ReadArgs>) {
                return read_file(args);
            } else if constexpr (std::is_same_v<T, WriteArgs>) {
                return write_file(args);
            } else if constexpr (std::is_same_v<T, ListArgs>) {
                return list_directory(args);
            } else if constexpr (std::is_same_v<T, GlobArgs>) {
                return glob_files(args);
            } else if constexpr (std::is_same_v<T, GrepArgs>) {
                return grep_files(args);
            } else {
                static_assert(std::is_same_v<T, PatchArgs>, "unhandled tool call");
                return patch_file(args);
            }
        },
        call);
}

ToolResult ToolHost::run_bash(const BashArgs& args,
                              const std::uint32_t request_timeout_ms) const {
    return support::guard_executor(
        "bash", [&] { return run_bash_impl(args, request_timeout_ms); });
}

ToolResult ToolHost::read_file(const ReadArgs& args) const {
    return support::guard_executor("read", [&] { return read_file_impl(args); });
}

ToolResult ToolHost::write_file(const WriteArgs& args) const {
    return support::guard_executor("write", [&] { return write_file_impl(args); });
}

ToolResult ToolHost::list_directory(const ListArgs& args) const {
    return support::guard_executor("list", [&] { return list_directory_impl(args); });
}

ToolResult ToolHost::glob_files(const GlobArgs& args) const {
    return support::guard_executor("glob", [&] { return glob_files_impl(args); });
}

ToolResult ToolHost::grep_files(const GrepArgs& args) const {
    return support::guard_executor("grep", [&] { return grep_files_impl(args); });
}

ToolResult ToolHost::patch_file(const PatchArgs& args) const {
    return support::guard_executor("patch", [&] { return patch_file_impl(args); });
}

std::vector<std::string> ToolHost::build_shell_environment() const {
    std::map<std::string, std::string> env;
    for (const auto& key : config_.inherited_env_keys) {
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            env[key] = value;
        }
    }
    if (env.find("PATH") == env.end()) {
        env["PATH"] = config_.fallback_path;
    }

    // Runtime-only path for secrets: the environment of the child, never the disk.
    for (auto& entry : vault_.snapshot()) {
        env[entry.first] = std::move(entry.second);
    }

    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& entry : env) {
        entries.push_back(entry.first + "=" + entry.second);
    }
    return entries;
}

std::string ToolHost::redact_secrets(std::string text) const {
    for (const auto& entry : vault_.snapshot()) {
        if (entry.second.empty()) {
            continue;
        }
        const std::string placeholder = "<credential:" + entry.first + ">";
        std::size_t pos = 0;
        while ((pos = text.find(entry.second, pos)) != std::string::npos) {
            text.replace(pos, entry.second.size(), placeholder);
            pos += placeholder.size();
        }
    }
    return text;
}

ToolResult ToolHost::run_bash_impl(const BashArgs& args,
                                   const std::uint32_t request_timeout_ms) const {
    const auto started = Clock::now();
    if (args.command.find_first_not_of(" \t\r\n") == std::string::npos) {
        return support::failure(ErrorCode::InvalidArgs,
                                "Missing \"command\" argument.", started);
    }

    std::uint32_t timeout_ms = args.timeout_ms.value_or(request_timeout_ms);
    if (timeout_ms == 0) {
        timeout_ms = config_.limits.max_shell_timeout_ms;
    }
    timeout_ms = std::min(timeout_ms, config_.limits.max_shell_timeout_ms);

    if (args.description.has_value() && !args.description->empty()) {
        LOG_INFO("[" + args.description.value() + "]");
    }
    LOG_DEBUG("bash: " + args.command);

    // Placeholders are resolved here and nowhere else.
    const std::string resolved = vault_.resolve_placeholders(args.command);

    const auto validation = validator_.validate(resolved);
    if (!validation.ok) {
        return support::failure(
            ErrorCode::PermissionDenied,
            redact_secrets(validation.error.value_or("Command validation failed")),
            started);
    }

    ShellRequest request;
    request.command = resolved;
    request.working_directory = resolver_.workspace_root();
    request.environment = build_shell_environment();
    request.timeout_ms = timeout_ms;
    request.max_output_bytes = config_.limits.max_shell_output_bytes;

    auto capture_result = run_shell_command(request);
    if (core::errors::is_error(capture_result)) {
        return support::from_error(core::errors::get_error(capture_result), started);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.timed_out) {
        ToolResult result = support::failure(ErrorCode::Timeout, "Command timed out.",
                                              started, true);
        result.duration_ms = static_cast<double>(timeout_ms);
        return result;
    }

    if (validation.has_network && capture.stdout_text.empty() &&
        capture.stderr_text.empty()) {
        return support::failure(ErrorCode::ExecutionError, kNetworkEmptyMessage, started);
    }

    std::string stdout_text = capture.stdout_text;
    if (capture.stdout_truncated) {
        stdout_text += "\n[... truncated]";
    }

    if (capture.exit_code != 0) {
        std::string error_output = capture.stderr_text;
        if (capture.stderr_truncated) {
            error_output += "\n[... truncated]";
        }
        if (error_output.empty()) {
            error_output =
                "Command failed with exit code " + std::to_string(capture.exit_code);
            if (!stdout_text.empty()) {
                error_output += "\n" + stdout_text;
            }
        }
        if (validation.has_network && looks_like_network_failure(error_output)) {
            error_output += kNetworkHint;
        }
        return support::failure(ErrorCode::ExecutionError, error_output, started);
    }

    std::string output = stdout_text;
    if (output.empty()) {
        output = capture.stderr_text.empty() ? "(no output)" : capture.stderr_text;
    }
    return support::success(std::move(output), started,
                            validation.has_network ? Provenance::Web
                                                   : Provenance::Internal);
}

std::string ToolHost::read_only_hint(const std::string& requested) const {
    const std::string shared = resolver_.shared_root().generic_string();
    const auto suggestion = resolver_.suggest_writable_path(requested);
    if (suggestion.has_value()) {
        return " The " + shared + "/ directory is read-only. Use a relative path instead: \"" +
               suggestion.value() + "\".";
    }
    return " Use a relative path (e.g. \"output.txt\", \"" +
           resolver_.shared_root().filename().generic_string() + "/name/file.md\").";
}

}  // namespace toolsrv::tools
