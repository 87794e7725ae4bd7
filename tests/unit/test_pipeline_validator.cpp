#include <string>
#include <gtest/gtest.h>
#include "policy/pipeline_validator.hpp"

namespace {

using toolsrv::policy::PipelinePolicy;
using toolsrv::policy::PipelineValidator;

TEST(PipelineValidatorTest, AcceptsSingleAllowlistedCommand) {
    PipelineValidator validator;
    const auto result = validator.validate("ls -la");
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_FALSE(result.has_network);
}

TEST(PipelineValidatorTest, AcceptsPipelineOfAllowlistedCommands) {
    PipelineValidator validator;
    EXPECT_TRUE(validator.validate("cat notes.txt | grep todo | sort | uniq | wc -l").ok);
}

TEST(PipelineValidatorTest, FlagsNetworkPipelines) {
    PipelineValidator validator;
    const auto result = validator.validate("curl https://x | jq .");
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.has_network);
}

TEST(PipelineValidatorTest, StripsDirectoryPrefixFromCommandName) {
    PipelineValidator validator;
    EXPECT_TRUE(validator.validate("/bin/echo hi").ok);
}

TEST(PipelineValidatorTest, RejectsControlOperators) {
    PipelineValidator validator;
    const auto chained = validator.validate("echo ok && rm -rf /");
    EXPECT_FALSE(chained.ok);
    EXPECT_EQ(chained.error.value_or(""),
              "Command contains disallowed control operators (|| or &&)");
    EXPECT_FALSE(validator.validate("false || echo fallback").ok);
}

TEST(PipelineValidatorTest, RejectsMetacharacters) {
    PipelineValidator validator;
    for (const std::string command :
         {"echo a; rm x", "echo `id`", "echo $(id)", "echo $HOME", "echo a > out",
          "cat < in", "echo a &", "echo a\nrm x", "echo \\x", "echo !!"}) {
        const auto result = validator.validate(command);
        EXPECT_FALSE(result.ok) << command;
        EXPECT_EQ(result.error.value_or(""), "Command contains disallowed metacharacters")
            << command;
    }
}

TEST(PipelineValidatorTest, RejectsEmptySegments) {
    PipelineValidator validator;
    EXPECT_EQ(validator.validate("echo a |").error.value_or(""), "Empty pipeline segment");
    EXPECT_EQ(validator.validate("| echo a").error.value_or(""), "Empty pipeline segment");
    EXPECT_FALSE(validator.validate("echo a | | wc").ok);
}

TEST(PipelineValidatorTest, NamesDisallowedCommandAndAllowlist) {
    PipelineValidator validator;
    const auto result = validator.validate("echo hi | python3 -c 1");
    ASSERT_FALSE(result.ok);
    const std::string error = result.error.value_or("");
    EXPECT_EQ(error.rfind("Command not allowed: python3. Allowed: ", 0), 0u);
    EXPECT_NE(error.find("awk, cat, cp, curl"), std::string::npos);
}

TEST(PipelineValidatorTest, HonorsCustomPolicy) {
    PipelinePolicy policy;
    policy.allowed_commands = {"git"};
    policy.network_commands = {"git"};
    PipelineValidator validator(policy);

    EXPECT_FALSE(validator.validate("ls").ok);
    const auto result = validator.validate("git status");
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.has_network);
}

}  // namespace
