#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/tool_errors.hpp"
#include "temp_workspace.hpp"

namespace {

using toolsrv::app::cli::parse_and_validate;
using toolsrv::core::config::ServerConfig;
using toolsrv::core::errors::ErrorCategory;
using toolsrv::core::errors::get_error;
using toolsrv::core::errors::get_value;
using toolsrv::core::errors::is_error;
using toolsrv::core::logging::LogLevel;
using toolsrv::testing::TempWorkspace;

toolsrv::core::errors::Result<ServerConfig> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("tool_server");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    TempWorkspace workspace("cli");
    auto result = parse_tokens({"serve", "--workspace", workspace.root().string(), "--port", "1"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"serve", "--workspace"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenIdleTimeoutNotNumeric) {
    TempWorkspace workspace("cli");
    auto result = parse_tokens({"serve", "--workspace", workspace.root().string(),
                                "--idle-timeout-ms", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenIdleTimeoutOutOfBounds) {
    TempWorkspace workspace("cli");
    auto result = parse_tokens({"serve", "--workspace", workspace.root().string(),
                                "--idle-timeout-ms", "5"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsOnUnknownLogLevel) {
    TempWorkspace workspace("cli");
    auto result = parse_tokens({"serve", "--workspace", workspace.root().string(),
                                "--log-level", "loud"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, FailsWhenWorkspaceInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens({"serve", "--workspace", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenRootsCoincide) {
    TempWorkspace workspace("cli");
    auto result = parse_tokens({"serve", "--workspace", workspace.root().string(),
                                "--skills", workspace.root().string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, ParsesValidServeCommand) {
    TempWorkspace workspace("cli");
    const auto skills = workspace.root() / "skills";
    std::filesystem::create_directories(skills);

    auto result = parse_tokens({"serve", "--workspace", workspace.root().string(), "--skills",
                                skills.string(), "--idle-timeout-ms", "60000", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.workspace_root, workspace.root());
    EXPECT_EQ(config.skills_root, skills);
    EXPECT_EQ(config.idle_timeout_ms, 60000u);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(CliParserTest, AcceptsMissingSkillsRootAndDefaults) {
    TempWorkspace workspace("cli");
    const auto skills = workspace.root() / "not-mounted";
    auto result = parse_tokens({"serve", "--workspace", workspace.root().string(), "--skills",
                                skills.string(), "--log-level", "warn"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.skills_root, skills);
    EXPECT_EQ(config.idle_timeout_ms, 300000u);
    EXPECT_EQ(config.log_level, LogLevel::WARN);
    EXPECT_EQ(config.limits.max_shell_timeout_ms, 120000u);
}

}  // namespace
