#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace toolsrv::tools {

struct ShellRequest {
    std::string command;
    std::filesystem::path working_directory;
    std::vector<std::string> environment;  // "NAME=value" entries, nothing inherited
    std::uint32_t timeout_ms = 5000;
    std::size_t max_output_bytes = 10 * 1024;  // per stream
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    double duration_ms = 0.0;
};

// Runs `/bin/sh -c command` in its own process group with stdin on /dev/null.
// On timeout the whole group is killed.
core::errors::Result<ProcessCapture> run_shell_command(const ShellRequest& request);

}  // namespace toolsrv::tools
