#include <gtest/gtest.h>
#include "core/errors/tool_errors.hpp"

using namespace winsys::core::errors;

// A dummy function to simulate an external command failing
Result<std::string> simulate_query(bool should_fail) {
    if (should_fail) {
        return ToolError{ErrorCategory::Execution, "Command failed: Get-Service", "external_command_failed"};
    }
    return std::string("Name Status");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_query(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "Name Status");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_query(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.message, "Command failed: Get-Service");
    EXPECT_EQ(error.code, "external_command_failed");
}

TEST(ErrorModelTest, ContextPrefixesMessageAndKeepsCode) {
    auto result = with_context(simulate_query(true), "Failed to list services");

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "Failed to list services: Command failed: Get-Service");
    EXPECT_EQ(get_error(result).code, "external_command_failed");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
}

TEST(ErrorModelTest, ContextLeavesSuccessUntouched) {
    auto result = with_context(simulate_query(false), "Failed to list services");

    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Name Status");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
