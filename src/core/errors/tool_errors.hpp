#pragma once
#include <string>
#include <utility>
#include <variant>

namespace winsys::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., unknown tool/action, missing or mistyped parameter
        Execution,  // E.g., an external command exited non-zero or timed out
        Policy,     // E.g., a host name that could be read as a command flag
        Protocol,   // E.g., malformed JSON-RPC framing
        Internal    // E.g., pipe/fork failure or a logic bug
    };

    // The standardized error payload
    struct ToolError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the caller
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a ToolError.
    template <typename T>
    using Result = std::variant<T, ToolError>;

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolError>(result);
    }

    template <typename T>
    const ToolError& get_error(const Result<T>& result) {
        return std::get<ToolError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Prefixes the message of an error result, keeping category and code.
    // "Failed to list processes" + "Command failed: ..." ->
    // "Failed to list processes: Command failed: ..."
    template <typename T>
    Result<T> with_context(Result<T> result, const std::string& context) {
        if (!is_error(result)) {
            return result;
        }
        ToolError error = std::get<ToolError>(std::move(result));
        error.message = context + ": " + error.message;
        return error;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace winsys::core::errors
