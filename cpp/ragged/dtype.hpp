#pragma once

/**
 * @file dtype.hpp
 * @brief Definition of the `dtype` enum and related utilities.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace ragged {

enum class dtype : uint8_t
{
    boolean,
    uint8,
    uint16,
    uint32,
    uint64,
    int8,
    int16,
    int32,
    int64,
    float32,
    float64,
    record,
    object,
    unknown
};

std::string_view dtype_to_str(dtype d);
dtype dtype_from_str(std::string_view s);

//////////////
/// dtype_enum
//////////////
template <typename T>
struct dtype_enum;

template <>
struct dtype_enum<bool>
{
    constexpr static auto value = dtype::boolean;
};

template <>
struct dtype_enum<uint8_t>
{
    constexpr static auto value = dtype::uint8;
};

template <>
struct dtype_enum<uint16_t>
{
    constexpr static auto value = dtype::uint16;
};

template <>
struct dtype_enum<uint32_t>
{
    constexpr static auto value = dtype::uint32;
};

template <>
struct dtype_enum<uint64_t>
{
    constexpr static auto value = dtype::uint64;
};

template <>
struct dtype_enum<int8_t>
{
    constexpr static auto value = dtype::int8;
};

template <>
struct dtype_enum<int16_t>
{
    constexpr static auto value = dtype::int16;
};

template <>
struct dtype_enum<int32_t>
{
    constexpr static auto value = dtype::int32;
};

template <>
struct dtype_enum<int64_t>
{
    constexpr static auto value = dtype::int64;
};

template <>
struct dtype_enum<float>
{
    constexpr static auto value = dtype::float32;
};

template <>
struct dtype_enum<double>
{
    constexpr static auto value = dtype::float64;
};

template <typename T>
constexpr auto dtype_enum_v = dtype_enum<std::remove_cvref_t<T>>::value;

template <typename T>
concept numeric = requires { dtype_enum<std::remove_cvref_t<T>>::value; };

constexpr bool dtype_is_numeric(dtype t)
{
    return t != dtype::record && t != dtype::object && t != dtype::unknown;
}

constexpr bool dtype_is_integral(dtype t)
{
    switch (t) {
    case dtype::uint8:
    case dtype::uint16:
    case dtype::uint32:
    case dtype::uint64:
    case dtype::int8:
    case dtype::int16:
    case dtype::int32:
    case dtype::int64:
        return true;
    default:
        return false;
    }
}

} // namespace ragged

#include "switch_dtype.hpp"
