#pragma once

#include "../array.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace ragged::impl {

/**
 * @brief Fixed-width numeric array over a shared byte buffer.
 *
 * Rows along the first axis are `step_` elements apart (negative for reversed slices), elements
 * inside a row are contiguous. Copies share the buffer, the writeable flag belongs to each
 * `dense_array` value.
 */
class dense_array
{
public:
    struct storage
    {
        std::vector<uint8_t> bytes;
    };

public:
    dense_array(std::shared_ptr<storage> buffer, enum dtype dtype, ragged::shape shape);

    dense_array(std::shared_ptr<storage> buffer,
                enum dtype dtype,
                ragged::shape shape,
                int64_t offset,
                int64_t step,
                bool writeable);

    enum dtype dtype() const noexcept
    {
        return dtype_;
    }

    const ragged::shape& shape() const noexcept
    {
        return shape_;
    }

    const auto& owner() const noexcept
    {
        return buffer_;
    }

    int64_t offset() const noexcept
    {
        return offset_;
    }

    int64_t itemsize() const noexcept
    {
        return itemsize_;
    }

    /// True when the elements occupy one gap-free, ascending byte range.
    bool is_contiguous() const noexcept;

    /// Bytes of a contiguous array.
    std::span<const uint8_t> data() const;

    element_value element(int64_t index) const;

    array get(int64_t index) const;

    array slice(const ragged::slice& s) const;

    array take(const array& positions) const;

    void set(int64_t index, const array& value);

    void put(const array& positions, const array& values);

    bool writeable() const noexcept
    {
        return writeable_;
    }

    void set_writeable(bool value) noexcept
    {
        writeable_ = value;
    }

private:
    int64_t row_volume() const noexcept
    {
        return shape_.tail().volume();
    }

    uint8_t* address(int64_t element_index) const noexcept
    {
        return buffer_->bytes.data() + element_index * itemsize_;
    }

    int64_t element_index(int64_t flat) const noexcept;

    void write_element(int64_t element_index, const element_value& value);

    void check_writeable() const;

private:
    std::shared_ptr<storage> buffer_;
    enum dtype dtype_;
    ragged::shape shape_;
    int64_t offset_ = 0;
    int64_t step_ = 0;
    int64_t itemsize_ = 0;
    bool writeable_ = true;
};

} // namespace ragged::impl
