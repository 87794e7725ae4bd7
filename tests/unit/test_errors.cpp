#include <gtest/gtest.h>
#include "core/errors/tool_errors.hpp"
#include "tools/tool_support.hpp"

using namespace toolsrv::core::errors;
using toolsrv::protocol::ErrorCode;

// A dummy function to simulate a tool failing
Result<std::string> simulate_read_file(bool should_fail) {
    if (should_fail) {
        return ToolError{ErrorCategory::NotFound, "File not found"};
    }
    return std::string("file contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_file(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_file(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::NotFound);
    EXPECT_EQ(error.message, "File not found");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, CategoriesMapOntoWireErrorCodes) {
    using toolsrv::tools::support::error_code_for;
    EXPECT_EQ(error_code_for(ErrorCategory::Input), ErrorCode::InvalidArgs);
    EXPECT_EQ(error_code_for(ErrorCategory::Policy), ErrorCode::PermissionDenied);
    EXPECT_EQ(error_code_for(ErrorCategory::NotFound), ErrorCode::NotFound);
    EXPECT_EQ(error_code_for(ErrorCategory::Timeout), ErrorCode::Timeout);
    EXPECT_EQ(error_code_for(ErrorCategory::Execution), ErrorCode::ExecutionError);
    EXPECT_EQ(error_code_for(ErrorCategory::Internal), ErrorCode::ExecutionError);
}

TEST(ErrorModelTest, OnlyTimeoutErrorsAreRetryable) {
    using toolsrv::tools::support::Clock;
    using toolsrv::tools::support::from_error;
    const auto started = Clock::now();

    const auto timeout = from_error(ToolError{ErrorCategory::Timeout, "slow"}, started);
    EXPECT_FALSE(timeout.ok);
    EXPECT_TRUE(timeout.retryable);

    const auto denied = from_error(
        ToolError{ErrorCategory::Policy, "Path traversal denied", "path_denied", "Use a relative path."},
        started);
    EXPECT_FALSE(denied.retryable);
    EXPECT_EQ(denied.output, "Path traversal denied Use a relative path.");
}
