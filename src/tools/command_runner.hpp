#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace winsys::tools {

struct CommandRequest {
    std::string program;
    std::vector<std::string> arguments;
    std::uint32_t timeout_ms = 0;  // 0 = wait for exit
};

struct CommandOutput {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Renders program and arguments the way they would be typed at a prompt.
std::string describe_command(const CommandRequest& request);

// The external process invoker. A non-zero exit, a timeout or a missing
// executable is an error result carrying the command's own diagnostics.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual core::errors::Result<CommandOutput> run(
        const CommandRequest& request) const = 0;
};

// Spawns the program directly (no intermediate shell) and captures both streams.
class ProcessCommandRunner final : public CommandRunner {
public:
    core::errors::Result<CommandOutput> run(
        const CommandRequest& request) const override;
};

}  // namespace winsys::tools
