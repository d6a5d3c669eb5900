#pragma once

/**
 * @file index_view.hpp
 * @brief Definition of the `index_view` class.
 */

#include "array.hpp"
#include "config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ragged {

/**
 * @brief Array whose element at position `i` is `content[index[i]]`.
 *
 * Reads gather through the index, writes scatter through it into the shared content. Positional
 * selections (slices, integer arrays, boolean masks) are applied to the index, the content is never
 * copied. The writeable flag belongs to the view, not to the content.
 */
class index_view
{
public:
    index_view(array index, array content, bool writeable = true, array_layout layout = {});

    const array& index() const noexcept
    {
        return index_;
    }

    /// Replaces the index. It must be 1-D and integral, an empty array of any dtype is accepted.
    void set_index(array value);

    const array& content() const noexcept
    {
        return content_;
    }

    void set_content(array value);

    bool writeable() const noexcept
    {
        return writeable_;
    }

    void set_writeable(bool value) noexcept
    {
        writeable_ = value;
    }

    const array_layout& layout() const noexcept
    {
        return layout_;
    }

    enum dtype dtype() const
    {
        return content_.dtype();
    }

    /// `(len(index),)` followed by the trailing dimensions of the content.
    ragged::shape shape() const;

    int64_t size() const
    {
        return index_.size();
    }

    array get(int64_t position) const;

    array slice(const ragged::slice& s) const;

    array take(const array& positions) const;

    /// Same index over one column of record content.
    index_view column(std::string_view name) const;

    array field(std::string_view name) const
    {
        return array(column(name));
    }

    std::vector<std::string> fields() const
    {
        return content_.fields();
    }

    void set(int64_t position, const array& value);

    void set(const ragged::slice& s, const array& value);

    void put(const array& positions, const array& values);

    /// Writes `value` into one column for every position of the view.
    void set(std::string_view name, const array& value);

protected:
    void check_writeable() const;

protected:
    array index_;
    array content_;
    bool writeable_;
    array_layout layout_;
};

} // namespace ragged
