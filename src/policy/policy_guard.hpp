#pragma once

#include <cstddef>
#include <string>
#include "core/errors/tool_errors.hpp"

namespace winsys::policy {

struct InputPolicy {
    std::size_t max_value_length = 1024;
    std::size_t max_host_length = 253;
    // Besides letters and digits; covers IPv6 literals and zone ids.
    std::string host_punctuation = ".-:_%";
};

// Screens client-supplied values before they reach an external command line.
class PolicyGuard {
public:
    explicit PolicyGuard(InputPolicy input_policy = {});

    // Host names and address literals; a leading '-' would read as a flag.
    core::errors::Result<std::string> validate_host(const std::string& host) const;

    // Free-text values such as service or process names and search terms.
    core::errors::Result<std::string> validate_value(const std::string& param_name,
                                                     const std::string& value) const;

private:
    static bool has_control_characters(const std::string& value);

    InputPolicy input_policy_;
};

}  // namespace winsys::policy
