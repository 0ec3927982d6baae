#include "tools/arguments.hpp"

#include <cmath>
#include <limits>
#include <utility>

namespace winsys::tools {

bool fits_integer(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    }
    if (value.is_number_float()) {
        // -2^63 and 2^63 are exact doubles; INT64_MAX is not.
        constexpr double kLimit = 9223372036854775808.0;
        const double number = value.get<double>();
        return std::isfinite(number) && number >= -kLimit && number < kLimit;
    }
    return value.is_number_integer();
}

Arguments::Arguments(nlohmann::json values) : values_(std::move(values)) {
    if (!values_.is_object()) {
        values_ = nlohmann::json::object();
    }
}

bool Arguments::has(const std::string& name) const {
    const auto it = values_.find(name);
    return it != values_.end() && !it->is_null();
}

std::optional<std::string> Arguments::get_string(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::int64_t> Arguments::get_integer(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end() || !it->is_number() || !fits_integer(*it)) {
        return std::nullopt;
    }
    if (it->is_number_float()) {
        return static_cast<std::int64_t>(std::trunc(it->get<double>()));
    }
    return it->get<std::int64_t>();
}

std::optional<bool> Arguments::get_bool(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end() || !it->is_boolean()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

std::string Arguments::string_or(const std::string& name,
                                 const std::string& fallback) const {
    return get_string(name).value_or(fallback);
}

std::int64_t Arguments::integer_or(const std::string& name,
                                   const std::int64_t fallback) const {
    return get_integer(name).value_or(fallback);
}

bool Arguments::bool_or(const std::string& name, const bool fallback) const {
    return get_bool(name).value_or(fallback);
}

}  // namespace winsys::tools
