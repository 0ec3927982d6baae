#include "tools/tool.hpp"

namespace winsys::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;

ToolError unknown_action_error(const std::string& action) {
    return ToolError{ErrorCategory::Input, "Unknown action: " + action, "unknown_action"};
}

ToolError missing_parameter_error(const std::string& message) {
    return ToolError{ErrorCategory::Input, message, "missing_parameter"};
}

Tool::Tool(const ToolContext& context) : context_(context) {}

std::uint32_t Tool::effective_timeout(const std::uint32_t extra_timeout_ms) const {
    const std::uint32_t base = context_.config.command_timeout_ms;
    if (base == 0) {
        return 0;
    }
    return base + extra_timeout_ms;
}

core::errors::Result<std::string> Tool::powershell(
    const std::string& script, const std::uint32_t extra_timeout_ms) const {
    CommandRequest request;
    request.program = context_.config.powershell_program;
    request.arguments = {"-NoProfile", "-NonInteractive", "-Command", script};
    request.timeout_ms = effective_timeout(extra_timeout_ms);

    auto output = context_.runner.run(request);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return core::errors::get_value(output).stdout_text;
}

core::errors::Result<std::string> Tool::native(
    const std::string& program, const std::vector<std::string>& arguments) const {
    CommandRequest request;
    request.program = program;
    request.arguments = arguments;
    request.timeout_ms = effective_timeout(0);

    auto output = context_.runner.run(request);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return core::errors::get_value(output).stdout_text;
}

}  // namespace winsys::tools
