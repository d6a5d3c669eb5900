#pragma once

/**
 * @file shape.hpp
 * @brief Definition of the `shape` class.
 */

#include <boost/container/small_vector.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <numeric>
#include <string>
#include <type_traits>

namespace ragged {

class shape
{
public:
    using value_type = int64_t;
    using container_type = boost::container::small_vector<value_type, 4>;
    using const_iterator = container_type::const_iterator;

public:
    shape() = default;

    template <typename T>
    requires std::is_integral_v<T>
    explicit shape(T value)
        : dims_{static_cast<value_type>(value)}
    {
    }

    shape(std::initializer_list<value_type> dims)
        : dims_(dims.begin(), dims.end())
    {
    }

    template <typename It>
    shape(It begin, It end)
        : dims_(begin, end)
    {
    }

    /// Number of dimensions.
    std::size_t size() const noexcept
    {
        return dims_.size();
    }

    bool empty() const noexcept
    {
        return dims_.empty();
    }

    value_type operator[](std::size_t i) const
    {
        return dims_[i];
    }

    value_type& operator[](std::size_t i)
    {
        return dims_[i];
    }

    const_iterator begin() const noexcept
    {
        return dims_.begin();
    }

    const_iterator end() const noexcept
    {
        return dims_.end();
    }

    /// All dimensions but the first one. Empty for 0-d and 1-d shapes.
    shape tail() const
    {
        if (dims_.size() <= 1) {
            return shape();
        }
        return shape(dims_.begin() + 1, dims_.end());
    }

    /// Shape with `first` prepended.
    shape prepend(value_type first) const
    {
        shape result;
        result.dims_.reserve(dims_.size() + 1);
        result.dims_.push_back(first);
        result.dims_.insert(result.dims_.end(), dims_.begin(), dims_.end());
        return result;
    }

    /// Product of all dimensions, 1 for 0-d shapes.
    value_type volume() const noexcept
    {
        return std::accumulate(dims_.begin(), dims_.end(), value_type(1), std::multiplies<value_type>());
    }

    bool operator==(const shape& other) const noexcept
    {
        return std::equal(dims_.begin(), dims_.end(), other.dims_.begin(), other.dims_.end());
    }

    std::string to_string() const
    {
        if (dims_.size() == 1) {
            return fmt::format("({},)", dims_[0]);
        }
        return fmt::format("({})", fmt::join(dims_, ", "));
    }

private:
    container_type dims_;
};

} // namespace ragged
