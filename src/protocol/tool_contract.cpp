#include "protocol/tool_contract.hpp"

namespace winsys::protocol {

using nlohmann::json;

const ActionSpec* ToolSpec::find_action(const std::string& action_name) const {
    for (const auto& action : actions) {
        if (action.name == action_name) {
            return &action;
        }
    }
    return nullptr;
}

const ParamSpec* ToolSpec::find_param(const std::string& param_name) const {
    for (const auto& param : params) {
        if (param.name == param_name) {
            return &param;
        }
    }
    return nullptr;
}

std::string to_string(const ParamType type) {
    switch (type) {
        case ParamType::String:
            return "string";
        case ParamType::Number:
            return "number";
        case ParamType::Boolean:
            return "boolean";
        default:
            return "unknown";
    }
}

json to_input_schema(const ToolSpec& spec) {
    json action_names = json::array();
    for (const auto& action : spec.actions) {
        action_names.push_back(action.name);
    }

    json properties = json::object();
    properties["action"] = {
        {"type", "string"},
        {"enum", action_names},
        {"description", "The " + spec.name + " action to perform"}};

    for (const auto& param : spec.params) {
        json property;
        property["type"] = to_string(param.type);
        property["description"] = param.description;
        if (!param.allowed_values.empty()) {
            property["enum"] = param.allowed_values;
        }
        if (!param.default_value.is_null()) {
            property["default"] = param.default_value;
        }
        properties[param.name] = property;
    }

    json schema;
    schema["type"] = "object";
    schema["properties"] = properties;
    schema["required"] = json::array({"action"});
    return schema;
}

json to_call_result(const ToolResponse& response) {
    json content = json::array();
    content.push_back({{"type", "text"}, {"text", response.text}});

    json result;
    result["content"] = content;
    result["isError"] = response.is_error;
    return result;
}

}  // namespace winsys::protocol
