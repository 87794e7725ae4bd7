#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolsrv::core::config {

    // Output and scan caps applied by the tool executors.
    struct ToolLimits {
        std::size_t max_shell_output_bytes = 10 * 1024;
        std::uint32_t max_shell_timeout_ms = 120000;
        std::size_t max_read_lines = 2000;
        std::size_t max_read_chars = 50 * 1024;
        std::size_t max_list_entries = 200;
        std::size_t max_glob_results = 100;
        std::size_t max_glob_scan = 5000;
        std::size_t max_grep_matches = 100;
        std::size_t max_grep_line_length = 200;
    };

    // Host variables a spawned shell may inherit. Everything else is dropped.
    inline std::vector<std::string> default_inherited_env_keys() {
        return {
            "PATH",
            "HOME",
            "USER",
            "LANG",
            "TERM",
            "NPM_CONFIG_CACHE",
            "PIP_USER",
            "PYTHONUSERBASE",
            "PIP_CACHE_DIR",
            "PIP_BREAK_SYSTEM_PACKAGES",
            "NODE_VERSION",
            "NODE_PATH"};
    }

    struct ServerConfig {
        std::filesystem::path workspace_root = "/workspace";  // writable
        std::filesystem::path skills_root = "/skills";        // read-only
        std::uint32_t idle_timeout_ms = 5 * 60 * 1000;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        ToolLimits limits;
        std::vector<std::string> inherited_env_keys = default_inherited_env_keys();
        std::string fallback_path =
            "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    };

} // namespace toolsrv::core::config
