#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/config/server_config.hpp"
#include "core/errors/tool_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/arguments.hpp"
#include "tools/command_runner.hpp"
#include "tools/port_scanner.hpp"

namespace winsys::tools {

// Collaborators every tool handler may use. Owned by the caller and
// outliving every tool built from it.
struct ToolContext {
    const CommandRunner& runner;
    const PortProber& prober;
    const core::config::ServerConfig& config;
    const policy::PolicyGuard& guard;
};

// Ties a closed action enum value to its advertised name and required params.
template <typename Action>
struct ActionBinding {
    Action action;
    protocol::ActionSpec spec;
};

template <typename Action>
std::optional<Action> find_action(const std::vector<ActionBinding<Action>>& bindings,
                                  const std::string& name) {
    for (const auto& binding : bindings) {
        if (binding.spec.name == name) {
            return binding.action;
        }
    }
    return std::nullopt;
}

template <typename Action>
std::vector<protocol::ActionSpec> action_specs(
    const std::vector<ActionBinding<Action>>& bindings) {
    std::vector<protocol::ActionSpec> specs;
    specs.reserve(bindings.size());
    for (const auto& binding : bindings) {
        specs.push_back(binding.spec);
    }
    return specs;
}

core::errors::ToolError unknown_action_error(const std::string& action);
core::errors::ToolError missing_parameter_error(const std::string& message);

class Tool {
public:
    explicit Tool(const ToolContext& context);
    virtual ~Tool() = default;

    Tool(const Tool&) = delete;
    Tool& operator=(const Tool&) = delete;

    virtual const protocol::ToolSpec& spec() const = 0;

    // `action` has been checked against spec() and `args` validated and defaulted.
    virtual core::errors::Result<std::string> run(const std::string& action,
                                                  const Arguments& args) const = 0;

protected:
    // Runs a PowerShell script and returns its standard output.
    core::errors::Result<std::string> powershell(const std::string& script,
                                                 std::uint32_t extra_timeout_ms = 0) const;

    // Runs a native utility with an argument vector and returns its standard output.
    core::errors::Result<std::string> native(const std::string& program,
                                             const std::vector<std::string>& arguments) const;

    const ToolContext& context() const { return context_; }

private:
    std::uint32_t effective_timeout(std::uint32_t extra_timeout_ms) const;

    ToolContext context_;
};

}  // namespace winsys::tools
