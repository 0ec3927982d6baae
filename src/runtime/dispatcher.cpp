#include "runtime/dispatcher.hpp"

#include <algorithm>
#include <exception>
#include "core/logging/logger.hpp"

namespace winsys::runtime {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using protocol::ParamSpec;
using protocol::ParamType;
using protocol::ToolResponse;

namespace {

bool matches_type(const nlohmann::json& value, const ParamType type) {
    switch (type) {
        case ParamType::String:
            return value.is_string();
        case ParamType::Number:
            return value.is_number();
        case ParamType::Boolean:
            return value.is_boolean();
    }
    return false;
}

ToolError invalid_parameter(const std::string& message, const std::string& hint = "") {
    return ToolError{ErrorCategory::Input, message, "invalid_parameter", hint};
}

std::string join(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += value;
    }
    return joined;
}

}  // namespace

Dispatcher::Dispatcher(const ToolRegistry& registry) : registry_(registry) {}

ToolResponse Dispatcher::failure(const std::string& label, const std::string& message) {
    return ToolResponse{"\xE2\x9D\x8C " + label + " operation failed: " + message, true};
}

core::errors::Result<tools::Arguments> Dispatcher::validate_arguments(
    const protocol::ToolSpec& spec, const std::string& action,
    const nlohmann::json& parameters) {
    const auto* action_spec = spec.find_action(action);
    if (action_spec == nullptr) {
        return ToolError{ErrorCategory::Input, "Unknown action: " + action, "unknown_action"};
    }
    if (!parameters.is_null() && !parameters.is_object()) {
        return invalid_parameter("Arguments must be a JSON object");
    }

    nlohmann::json validated = nlohmann::json::object();
    for (const ParamSpec& param : spec.params) {
        const auto it = parameters.is_object() ? parameters.find(param.name) : parameters.end();
        if (parameters.is_object() && it != parameters.end() && !it->is_null()) {
            if (!matches_type(*it, param.type)) {
                return invalid_parameter("Parameter '" + param.name + "' must be a " +
                                         protocol::to_string(param.type));
            }
            if (param.type == ParamType::Number && !tools::fits_integer(*it)) {
                return invalid_parameter("Parameter '" + param.name + "' is out of range",
                                         "Use a whole number between -2^63 and 2^63-1");
            }
            if (!param.allowed_values.empty() &&
                std::find(param.allowed_values.begin(), param.allowed_values.end(),
                          it->get<std::string>()) == param.allowed_values.end()) {
                return invalid_parameter("Invalid value '" + it->get<std::string>() +
                                             "' for parameter '" + param.name + "'",
                                         "Allowed values: " + join(param.allowed_values));
            }
            validated[param.name] = *it;
        } else if (!param.default_value.is_null()) {
            validated[param.name] = param.default_value;
        }
    }

    for (const auto& required : action_spec->required_params) {
        if (!validated.contains(required)) {
            return ToolError{ErrorCategory::Input,
                             "Missing required parameter '" + required + "' for action '" +
                                 action + "'",
                             "missing_parameter"};
        }
    }
    return tools::Arguments(std::move(validated));
}

ToolResponse Dispatcher::handle(const protocol::ToolCall& call) const {
    const tools::Tool* tool = registry_.find(call.name);
    if (tool == nullptr) {
        WINSYS_LOG_WARN("Unknown tool requested: " + call.name);
        return ToolResponse{"\xE2\x9D\x8C Unknown tool: " + call.name, true};
    }

    const auto it = call.arguments.is_object() ? call.arguments.find("action")
                                               : call.arguments.end();
    if (!call.arguments.is_object() || it == call.arguments.end() || it->is_null()) {
        return failure(tool->spec().label, "Missing required parameter 'action'");
    }
    if (!it->is_string()) {
        return failure(tool->spec().label, "Parameter 'action' must be a string");
    }
    return handle(call.name, it->get<std::string>(), call.arguments);
}

ToolResponse Dispatcher::handle(const std::string& tool_name, const std::string& action,
                                const nlohmann::json& parameters) const {
    const tools::Tool* tool = registry_.find(tool_name);
    if (tool == nullptr) {
        WINSYS_LOG_WARN("Unknown tool requested: " + tool_name);
        return ToolResponse{"\xE2\x9D\x8C Unknown tool: " + tool_name, true};
    }

    const auto& spec = tool->spec();
    WINSYS_LOG_INFO("Dispatching " + tool_name + "." + action);

    auto arguments = validate_arguments(spec, action, parameters);
    if (core::errors::is_error(arguments)) {
        const auto& err = core::errors::get_error(arguments);
        WINSYS_LOG_WARN(tool_name + "." + action + " rejected [" + err.code + "]: " +
                        err.message);
        return failure(spec.label, err.message);
    }

    core::errors::Result<std::string> report = std::string();
    try {
        report = tool->run(action, core::errors::get_value(arguments));
    } catch (const std::exception& ex) {
        report = ToolError{ErrorCategory::Internal, ex.what(), "internal_error"};
    }

    if (core::errors::is_error(report)) {
        const auto& err = core::errors::get_error(report);
        WINSYS_LOG_WARN(tool_name + "." + action + " failed [" + err.code + "]: " +
                        err.message);
        if (!err.hint.empty()) {
            WINSYS_LOG_INFO("Hint: " + err.hint);
        }
        return failure(spec.label, err.message);
    }
    return ToolResponse{core::errors::get_value(report), false};
}

}  // namespace winsys::runtime
