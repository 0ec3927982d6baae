#include <cstdint>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/tool_errors.hpp"
#include "tools/command_runner.hpp"

namespace {

using winsys::core::errors::ErrorCategory;
using winsys::core::errors::get_error;
using winsys::core::errors::get_value;
using winsys::core::errors::is_error;
using winsys::tools::CommandRequest;
using winsys::tools::describe_command;
using winsys::tools::ProcessCommandRunner;

CommandRequest shell(const std::string& script, const std::uint32_t timeout_ms = 5000) {
    CommandRequest request;
    request.program = "/bin/sh";
    request.arguments = {"-c", script};
    request.timeout_ms = timeout_ms;
    return request;
}

TEST(CommandRunnerTest, CapturesStandardOutput) {
    ProcessCommandRunner runner;
    auto result = runner.run(shell("printf hello"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_EQ(get_value(result).stdout_text, "hello");
    EXPECT_TRUE(get_value(result).stderr_text.empty());
}

TEST(CommandRunnerTest, NonZeroExitCarriesStandardError) {
    ProcessCommandRunner runner;
    auto result = runner.run(shell("echo 'access is denied' >&2; exit 3"));
    ASSERT_TRUE(is_error(result));

    const auto& error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.code, "external_command_failed");
    EXPECT_EQ(error.message.rfind("Command failed: /bin/sh -c", 0), 0u);
    EXPECT_NE(error.message.find("\naccess is denied"), std::string::npos);
}

TEST(CommandRunnerTest, SilentFailureReportsExitCode) {
    ProcessCommandRunner runner;
    auto result = runner.run(shell("exit 4"));
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("exit code 4"), std::string::npos);
}

TEST(CommandRunnerTest, KillsCommandAfterTimeout) {
    ProcessCommandRunner runner;
    auto result = runner.run(shell("sleep 5", 200));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_timed_out");
    EXPECT_NE(get_error(result).message.find("200 ms"), std::string::npos);
}

TEST(CommandRunnerTest, MissingProgramIsReported) {
    ProcessCommandRunner runner;
    CommandRequest request;
    request.program = "winsys-no-such-program";
    auto result = runner.run(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_not_found");
    EXPECT_EQ(get_error(result).message.rfind("Command not found: winsys-no-such-program", 0), 0u);
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CommandRunnerTest, EmptyProgramIsRejected) {
    ProcessCommandRunner runner;
    auto result = runner.run(CommandRequest{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "spawn_failed");
}

TEST(CommandRunnerTest, ArgumentsAreNotShellExpanded) {
    ProcessCommandRunner runner;
    CommandRequest request;
    request.program = "/bin/echo";
    request.arguments = {"$HOME; whoami"};
    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "$HOME; whoami\n");
}

TEST(CommandRunnerTest, DescribesCommandLine) {
    CommandRequest request;
    request.program = "powershell";
    request.arguments = {"-NoProfile", "-Command", "Get-Service | Select Name"};
    EXPECT_EQ(describe_command(request),
              "powershell -NoProfile -Command \"Get-Service | Select Name\"");
}

}  // namespace
