#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/config/server_config.hpp"
#include "policy/path_resolver.hpp"
#include "policy/pipeline_validator.hpp"
#include "protocol/tool_contract.hpp"
#include "session/credential_vault.hpp"
#include "tools/tool_call.hpp"

namespace toolsrv::tools {

// The seven executors. Every entry point returns a ToolResult and never throws.
class ToolHost {
public:
    ToolHost(core::config::ServerConfig config, const policy::PathResolver& resolver,
             const session::CredentialVault& vault,
             policy::PipelineValidator validator = policy::PipelineValidator{});

    protocol::ToolResult execute(const ToolCall& call,
                                 std::uint32_t request_timeout_ms) const;

    protocol::ToolResult run_bash(const BashArgs& args,
                                  std::uint32_t request_timeout_ms) const;
    protocol::ToolResult read_file(const ReadArgs& args) const;
    protocol::ToolResult write_file(const WriteArgs& args) const;
    protocol::ToolResult list_directory(const ListArgs& args) const;
    protocol::ToolResult glob_files(const GlobArgs& args) const;
    protocol::ToolResult grep_files(const GrepArgs& args) const;
    protocol::ToolResult patch_file(const PatchArgs& args) const;

    // Inherited allowlist plus one entry per stored credential, as "NAME=value".
    std::vector<std::string> build_shell_environment() const;

private:
    protocol::ToolResult run_bash_impl(const BashArgs& args,
                                       std::uint32_t request_timeout_ms) const;
    protocol::ToolResult read_file_impl(const ReadArgs& args) const;
    protocol::ToolResult write_file_impl(const WriteArgs& args) const;
    protocol::ToolResult list_directory_impl(const ListArgs& args) const;
    protocol::ToolResult glob_files_impl(const GlobArgs& args) const;
    protocol::ToolResult grep_files_impl(const GrepArgs& args) const;
    protocol::ToolResult patch_file_impl(const PatchArgs& args) const;

    std::string read_only_hint(const std::string& requested) const;
    std::string redact_secrets(std::string text) const;

    core::config::ServerConfig config_;
    const policy::PathResolver& resolver_;
    const session::CredentialVault& vault_;
    policy::PipelineValidator validator_;
};

}  // namespace toolsrv::tools
