#pragma once

/**
 * @file byte_decoded_view.hpp
 * @brief Definition of the `byte_decoded_view` class.
 */

#include "array.hpp"
#include "config.hpp"

#include <cstddef>
#include <vector>

namespace ragged {

/**
 * @brief Array of fixed-width scalars decoded from a raw byte buffer.
 *
 * The element at position `i` is the value of the declared dtype stored in the `itemsize` bytes starting
 * at byte offset `index[i]` of the content. Offsets may overlap and need not be aligned. The content is
 * held as a flat byte view, and the writeable flag of the view is also the flag of that byte view.
 */
class byte_decoded_view
{
public:
    byte_decoded_view(array index, array content, enum dtype dtype, bool writeable = true, array_layout layout = {});

    const array& index() const noexcept
    {
        return index_;
    }

    void set_index(array value);

    /// Byte view over the content storage.
    const array& content() const noexcept
    {
        return content_;
    }

    /// Views `value` as bytes. Non-contiguous content is copied.
    void set_content(array value);

    /// Declared element type. Validated when the first read or write needs its itemsize.
    enum dtype dtype() const noexcept
    {
        return dtype_;
    }

    void set_dtype(enum dtype value) noexcept
    {
        dtype_ = value;
    }

    bool writeable() const noexcept
    {
        return writeable_;
    }

    void set_writeable(bool value);

    const array_layout& layout() const noexcept
    {
        return layout_;
    }

    ragged::shape shape() const
    {
        return ragged::shape(index_.size());
    }

    int64_t size() const
    {
        return index_.size();
    }

    /// 0-d array holding the value stored at byte offset `index[position]`.
    array get(int64_t position) const;

    array slice(const ragged::slice& s) const;

    array take(const array& positions) const;

    void set(int64_t position, const array& value);

    void set(const ragged::slice& s, const array& value);

    void put(const array& positions, const array& values);

private:
    std::size_t itemsize() const;

    /// Checks that every offset leaves room for a full element and returns the offsets.
    std::vector<int64_t> checked_offsets(const array& offsets) const;

    array decode(const array& offsets) const;

    void encode(const array& offsets, const array& values);

private:
    array index_;
    array content_;
    enum dtype dtype_;
    bool writeable_;
    array_layout layout_;
};

} // namespace ragged
