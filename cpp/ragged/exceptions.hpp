#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `ragged` module.
 */

#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace ragged {

/**
 * @brief Base class for all ragged exceptions.
 */
class exception : public std::exception
{
public:
    using params_t = std::map<std::string, std::string, std::less<>>;

public:
    explicit exception(std::string&& what)
        : what_(std::move(what))
    {
    }

    exception(std::string&& what, params_t&& params)
        : what_(std::move(what))
        , params_(std::move(params))
    {
    }

    const char* what() const noexcept override
    {
        return what_.c_str();
    }

    const std::string& message() const noexcept
    {
        return what_;
    }

    const auto& params() const noexcept
    {
        return params_;
    }

private:
    std::string what_;
    params_t params_;
};

class invalid_type : public exception
{
public:
    explicit invalid_type(std::string&& message)
        : exception(std::move(message))
    {
    }
};

class unknown_dtype : public invalid_type
{
public:
    unknown_dtype()
        : invalid_type(std::string("Dtype is unknown."))
    {
    }

    explicit unknown_dtype(std::string_view dtype)
        : invalid_type(fmt::format("Unknown dtype: {}", dtype))
    {
    }
};

class non_numeric_dtype : public exception
{
public:
    explicit non_numeric_dtype(std::string_view t)
        : exception(fmt::format("Dtype {} is not numeric.", t), {{"dtype", std::string(t)}})
    {
    }
};

class invalid_shape : public invalid_type
{
public:
    explicit invalid_shape(std::string_view shape)
        : invalid_type(fmt::format("shape must be a non-empty tuple of non-negative integers, got {}", shape))
    {
    }
};

class invalid_operation : public exception
{
public:
    explicit invalid_operation(const std::string& what)
        : exception(std::string("Invalid Operation: ") + what)
    {
    }
};

class read_only : public exception
{
public:
    read_only()
        : exception(std::string("assignment destination is read-only"))
    {
    }
};

class index_out_of_bounds : public exception
{
public:
    index_out_of_bounds(int64_t index, int64_t size)
        : exception(size == 0 ? fmt::format("Cannot subscript an empty array. Tried to subscript with index: {}", index)
                              : fmt::format("Index {} is out of bounds [0-{})", index, size),
                    {{"index", std::to_string(index)}, {"size", std::to_string(size)}})
    {
    }
};

class shape_mismatch : public exception
{
public:
    shape_mismatch(std::string_view what, std::string_view left, std::string_view other, std::string_view right)
        : exception(fmt::format("{} shape {} does not match {} shape {}", what, left, other, right))
    {
    }
};

class length_mismatch : public exception
{
public:
    length_mismatch(int64_t size, int64_t dimension)
        : exception(fmt::format("cannot copy sequence with size {} to array axis with dimension {}", size, dimension),
                    {{"size", std::to_string(size)}, {"dimension", std::to_string(dimension)}})
    {
    }
};

class materialization_error : public exception
{
public:
    explicit materialization_error(std::string&& what)
        : exception(std::move(what))
    {
    }
};

} // namespace ragged
