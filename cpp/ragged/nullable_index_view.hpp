#pragma once

/**
 * @file nullable_index_view.hpp
 * @brief Definition of the `nullable_index_view` class.
 */

#include "index_view.hpp"
#include "write_operand.hpp"

namespace ragged {

/**
 * @brief `index_view` in which positions whose index equals `masked_when` are missing.
 *
 * Missing positions read as `none()`. Writing a missing marker sets the index of the target to
 * `masked_when`. Content is only written through positions that are not missing, and a missing position
 * stays missing until its index is reassigned by the owner of the index. `masked_when` must be representable
 * in the dtype of the index.
 *
 * The plain `index_view` interface is not exposed, a masked position can only be read through this class.
 */
class nullable_index_view : private index_view
{
public:
    using index_view::content;
    using index_view::dtype;
    using index_view::fields;
    using index_view::index;
    using index_view::layout;
    using index_view::set_content;
    using index_view::set_writeable;
    using index_view::shape;
    using index_view::size;
    using index_view::writeable;

    nullable_index_view(array index,
                        array content,
                        int64_t masked_when = -1,
                        bool writeable = true,
                        array_layout layout = {});

    int64_t masked_when() const noexcept
    {
        return masked_when_;
    }

    /// Throws `invalid_type` when `value` does not fit the index dtype.
    void set_masked_when(int64_t value);

    /// Replaces the index. Throws `invalid_type` when `masked_when` does not fit its dtype.
    void set_index(array value);

    bool is_missing(int64_t position) const;

    /// Boolean array, true at the missing positions.
    array mask() const;

    /// The view itself paired with its mask, usable as the source of another nullable write.
    masked_source to_masked_source() const;

    array get(int64_t position) const;

    array slice(const ragged::slice& s) const;

    array take(const array& positions) const;

    nullable_index_view column(std::string_view name) const;

    array field(std::string_view name) const
    {
        return array(column(name));
    }

    void set(int64_t position, const write_operand& what);

    void set(const ragged::slice& s, const write_operand& what);

    void put(const array& positions, const write_operand& what);

    void set(std::string_view name, const write_operand& what);

private:
    /**
     * @brief Writes `what` into the index positions `targets`.
     *
     * With `scalar_target` a plain array is stored whole into the one target, otherwise its first axis is
     * matched against the targets.
     */
    void write(const std::vector<int64_t>& targets, bool scalar_target, const write_operand& what);

private:
    int64_t masked_when_;
};

} // namespace ragged
