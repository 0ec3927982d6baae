#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/tool_registry.hpp"
#include "tools/arguments.hpp"

namespace winsys::runtime {

// Routes one request to its tool handler and turns every error into a
// failure response. Nothing a single request does escapes as an exception.
class Dispatcher {
public:
    explicit Dispatcher(const ToolRegistry& registry);

    // `call.arguments` carries the action name under "action".
    protocol::ToolResponse handle(const protocol::ToolCall& call) const;

    protocol::ToolResponse handle(const std::string& tool_name, const std::string& action,
                                  const nlohmann::json& parameters) const;

    // Checks the action and every declared parameter against the schema, fills
    // in declared defaults and enforces the action's required parameters.
    // Undeclared parameters are dropped; explicit nulls count as absent.
    static core::errors::Result<tools::Arguments> validate_arguments(
        const protocol::ToolSpec& spec, const std::string& action,
        const nlohmann::json& parameters);

private:
    static protocol::ToolResponse failure(const std::string& label, const std::string& message);

    const ToolRegistry& registry_;
};

}  // namespace winsys::runtime
