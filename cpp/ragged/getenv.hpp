#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>

namespace ragged {

/// Reads an environment variable. Returns `std::nullopt` when it is unset or empty.
inline std::optional<std::string> getenv(const std::string& name)
{
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

/// Reads an integral environment variable, falling back to `default_value` when it is unset or not a number.
template <typename T>
requires std::is_integral_v<T>
inline T getenv(const std::string& name, T default_value)
{
    auto value = getenv(name);
    if (!value) {
        return default_value;
    }
    char* end = nullptr;
    auto result = std::strtoll(value->c_str(), &end, 10);
    if (end == value->c_str() || *end != '\0') {
        return default_value;
    }
    return static_cast<T>(result);
}

} // namespace ragged
