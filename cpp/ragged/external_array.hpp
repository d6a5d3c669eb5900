#pragma once

/**
 * @file external_array.hpp
 * @brief Definition of the `external_array` class.
 */

#include "array.hpp"
#include "function.hpp"

#include <utility>
#include <variant>

namespace ragged {

/// Position, range or integer/boolean array selecting along the first axis.
using selection = std::variant<int64_t, slice, array>;

/**
 * @brief Array whose storage lives outside the process, reached through read and write callables.
 *
 * Selections are passed to the callables unchanged, including negative positions given to an `array`
 * handle. Dtype and shape are declared, not inferred. Without a write callable the array is read-only.
 */
class external_array
{
public:
    static constexpr bool owns_addressing = true;

    using read_t = function<array(const selection&) const>;
    using write_t = function<void(const selection&, const array&) const>;

public:
    external_array(enum dtype dtype, ragged::shape shape, read_t read, write_t write = nullptr);

    enum dtype dtype() const noexcept
    {
        return dtype_;
    }

    void set_dtype(enum dtype value);

    const ragged::shape& shape() const noexcept
    {
        return shape_;
    }

    void set_shape(ragged::shape value);

    void set_read(read_t read) noexcept
    {
        read_ = std::move(read);
    }

    void set_write(write_t write) noexcept
    {
        write_ = std::move(write);
    }

    bool readable() const noexcept
    {
        return static_cast<bool>(read_);
    }

    bool writeable() const noexcept
    {
        return static_cast<bool>(write_);
    }

    int64_t size() const noexcept
    {
        return shape_[0];
    }

    array read(const selection& where) const;

    void write(const selection& where, const array& value) const;

    array get(int64_t position) const
    {
        return read(position);
    }

    array slice(const ragged::slice& s) const
    {
        return read(s);
    }

    array take(const array& positions) const
    {
        return read(positions);
    }

    void set(int64_t position, const array& value)
    {
        write(position, value);
    }

    void set(const ragged::slice& s, const array& value)
    {
        write(s, value);
    }

    void put(const array& positions, const array& values)
    {
        write(positions, values);
    }

private:
    enum dtype dtype_;
    ragged::shape shape_;
    read_t read_;
    write_t write_;
};

} // namespace ragged
