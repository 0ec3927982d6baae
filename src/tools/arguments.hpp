#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace winsys::tools {

// True when a JSON number converts to std::int64_t without overflow.
// Fractions are allowed and truncate toward zero.
bool fits_integer(const nlohmann::json& value);

// Read access to parameters that already passed schema validation, with
// declared defaults filled in.
class Arguments {
public:
    Arguments() = default;
    explicit Arguments(nlohmann::json values);

    bool has(const std::string& name) const;

    std::optional<std::string> get_string(const std::string& name) const;
    std::optional<std::int64_t> get_integer(const std::string& name) const;
    std::optional<bool> get_bool(const std::string& name) const;

    std::string string_or(const std::string& name, const std::string& fallback) const;
    std::int64_t integer_or(const std::string& name, std::int64_t fallback) const;
    bool bool_or(const std::string& name, bool fallback) const;

    const nlohmann::json& raw() const { return values_; }

private:
    nlohmann::json values_ = nlohmann::json::object();
};

}  // namespace winsys::tools
