#include "policy/policy_guard.hpp"

#include <cctype>
#include <utility>

namespace winsys::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;

PolicyGuard::PolicyGuard(InputPolicy input_policy)
    : input_policy_(std::move(input_policy)) {}

bool PolicyGuard::has_control_characters(const std::string& value) {
    for (const unsigned char c : value) {
        if (c < 0x20 || c == 0x7f) {
            return true;
        }
    }
    return false;
}

core::errors::Result<std::string> PolicyGuard::validate_host(
    const std::string& host) const {
    if (host.empty()) {
        return ToolError{ErrorCategory::Input, "Host cannot be empty.", "invalid_host"};
    }
    if (host.size() > input_policy_.max_host_length) {
        return ToolError{ErrorCategory::Input, "Host name is too long.", "invalid_host"};
    }
    if (host.front() == '-') {
        return ToolError{ErrorCategory::Policy,
                         "Host cannot start with '-': " + host, "invalid_host"};
    }

    for (const char c : host) {
        const bool allowed = std::isalnum(static_cast<unsigned char>(c)) != 0 ||
                             input_policy_.host_punctuation.find(c) != std::string::npos;
        if (!allowed) {
            return ToolError{ErrorCategory::Policy,
                             "Host contains an unsupported character: " + host,
                             "invalid_host",
                             "Use a host name, an IPv4 address or an IPv6 literal."};
        }
    }
    return host;
}

core::errors::Result<std::string> PolicyGuard::validate_value(
    const std::string& param_name, const std::string& value) const {
    if (value.empty()) {
        return ToolError{ErrorCategory::Input, param_name + " cannot be empty.",
                         "invalid_parameter"};
    }
    if (value.size() > input_policy_.max_value_length) {
        return ToolError{ErrorCategory::Input, param_name + " is too long.",
                         "invalid_parameter"};
    }
    if (has_control_characters(value)) {
        return ToolError{ErrorCategory::Policy,
                         param_name + " contains control characters.",
                         "invalid_parameter"};
    }
    return value;
}

}  // namespace winsys::policy
