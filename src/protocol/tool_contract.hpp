#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace winsys::protocol {

    enum class ParamType {
        String,
        Number,
        Boolean
    };

    // One advertised parameter of a tool
    struct ParamSpec {
        std::string name;
        ParamType type;
        std::string description;
        std::vector<std::string> allowed_values;  // empty = unconstrained
        nlohmann::json default_value = nullptr;   // null = no default
    };

    // One closed action of a tool, with the parameters it cannot run without
    struct ActionSpec {
        std::string name;
        std::vector<std::string> required_params;
    };

    struct ToolSpec {
        std::string name;
        std::string label;        // e.g. "File system", used in failure text
        std::string description;
        std::vector<ActionSpec> actions;
        std::vector<ParamSpec> params;

        const ActionSpec* find_action(const std::string& action_name) const;
        const ParamSpec* find_param(const std::string& param_name) const;
    };

    // How the client asks for a tool to run
    struct ToolCall {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    // How a tool replies back: report text, or failure text with the flag set
    struct ToolResponse {
        std::string text;
        bool is_error = false;
    };

    std::string to_string(ParamType type);

    // JSON Schema advertised through tools/list
    nlohmann::json to_input_schema(const ToolSpec& spec);

    nlohmann::json to_call_result(const ToolResponse& response);

} // namespace winsys::protocol
