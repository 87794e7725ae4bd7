#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace toolsrv::app::cli {

    using namespace toolsrv::core::errors;
    using toolsrv::core::config::ServerConfig;
    using toolsrv::core::logging::LogLevel;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> workspace;
        std::optional<std::string> skills;
        std::optional<std::string> idle_timeout_ms;
        std::optional<std::string> log_level;
        bool verbose = false;
    };

    namespace {

        constexpr const char* kUsage =
            "Usage: tool_server serve [--workspace DIR] [--skills DIR] "
            "[--idle-timeout-ms N] [--log-level debug|info|warn|error] [--verbose]";

        Result<std::filesystem::path> canonical_directory(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return ToolError{ErrorCategory::Input, flag + " does not exist or is not a directory: " + raw, "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return ToolError{ErrorCategory::Input, "Failed to canonicalize " + flag + ": " + raw, "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ToolError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return ToolError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Only the 'serve' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--workspace") {
                if (i + 1 < args.size()) raw.workspace = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --workspace", "missing_value"};
            } else if (args[i] == "--skills") {
                if (i + 1 < args.size()) raw.skills = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --skills", "missing_value"};
            } else if (args[i] == "--idle-timeout-ms") {
                if (i + 1 < args.size()) raw.idle_timeout_ms = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --idle-timeout-ms", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ToolError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config;

        // Exception-free integer parsing
        if (raw.idle_timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.idle_timeout_ms->data();
            const char* end = raw.idle_timeout_ms->data() + raw.idle_timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return ToolError{ErrorCategory::Input, "Invalid number for --idle-timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout < 100 || timeout > 24u * 60u * 60u * 1000u) {
                return ToolError{ErrorCategory::Input, "--idle-timeout-ms out of bounds", "bounds_error", "Must be between 100 and 86400000."};
            }
            config.idle_timeout_ms = timeout;
        }

        if (raw.log_level) {
            const std::string& level = raw.log_level.value();
            if (level == "debug") config.log_level = LogLevel::DEBUG;
            else if (level == "info") config.log_level = LogLevel::INFO;
            else if (level == "warn") config.log_level = LogLevel::WARN;
            else if (level == "error") config.log_level = LogLevel::ERROR;
            else return ToolError{ErrorCategory::Input, "Invalid value for --log-level: " + level, "invalid_log_level", "Use debug, info, warn or error."};
        }
        if (raw.verbose) {
            config.log_level = LogLevel::DEBUG;
        }

        // Path validation. The workspace must exist; the shared root may be absent.
        auto workspace = canonical_directory(raw.workspace.value_or(config.workspace_root.string()), "--workspace");
        if (is_error(workspace)) {
            return get_error(workspace);
        }
        config.workspace_root = get_value(workspace);

        if (raw.skills) {
            std::error_code exists_ec;
            if (std::filesystem::exists(raw.skills.value(), exists_ec)) {
                auto skills = canonical_directory(raw.skills.value(), "--skills");
                if (is_error(skills)) {
                    return get_error(skills);
                }
                config.skills_root = get_value(skills);
            } else {
                config.skills_root = std::filesystem::absolute(raw.skills.value()).lexically_normal();
            }
        }

        if (config.workspace_root == config.skills_root) {
            return ToolError{ErrorCategory::Input, "--workspace and --skills must be different directories", "conflicting_flags"};
        }

        return config;
    }

} // namespace toolsrv::app::cli
