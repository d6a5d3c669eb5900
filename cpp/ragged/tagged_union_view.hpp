#pragma once

/**
 * @file tagged_union_view.hpp
 * @brief Definition of the `tagged_union_view` class.
 */

#include "array.hpp"
#include "config.hpp"

#include <string_view>
#include <vector>

namespace ragged {

/**
 * @brief Heterogeneous array. The element at position `i` is `contents[tags[i]][index[i]]`.
 *
 * Tags and index are 1-D integral arrays of equal shape, checked on every read and write. Selections
 * that only reference one content collapse to a plain gather from that content.
 */
class tagged_union_view
{
public:
    tagged_union_view(array tags,
                      array index,
                      std::vector<array> contents,
                      bool writeable = true,
                      array_layout layout = {});

    const array& tags() const noexcept
    {
        return tags_;
    }

    void set_tags(array value);

    const array& index() const noexcept
    {
        return index_;
    }

    void set_index(array value);

    const std::vector<array>& contents() const noexcept
    {
        return contents_;
    }

    void set_contents(std::vector<array> value);

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

    enum dtype dtype() const noexcept
    {
        return dtype::object;
    }

    ragged::shape shape() const
    {
        return ragged::shape(tags_.size());
    }

    int64_t size() const
    {
        return tags_.size();
    }

    array get(int64_t position) const;

    array slice(const ragged::slice& s) const;

    array take(const array& positions) const;

    /// Same tags and index over one column of every content.
    tagged_union_view column(std::string_view name) const;

    array field(std::string_view name) const
    {
        return array(column(name));
    }

    void set(int64_t position, const array& value);

    void set(const ragged::slice& s, const array& value);

    void put(const array& positions, const array& values);

    void set(std::string_view name, const array& value);

private:
    void check_shapes() const;

    array& content_for(int64_t tag);

    const array& content_for(int64_t tag) const;

    /// View over the selected tags and index, or a plain gather when a single tag is referenced.
    array select(array tags, array index) const;

    /// Groups the positions `targets` by tag and writes `what` into each referenced content.
    void write(const std::vector<int64_t>& targets, bool scalar_target, const array& what);

private:
    array tags_;
    array index_;
    std::vector<array> contents_;
    bool writeable_;
    array_layout layout_;
};

} // namespace ragged
