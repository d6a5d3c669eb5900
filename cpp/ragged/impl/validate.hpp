#pragma once

#include "../array.hpp"
#include "../config.hpp"

#include <string_view>

namespace ragged::impl {

/**
 * @brief Checks that `value` can serve as an index or tag array: 1-D with integral dtype.
 *
 * A length-0 array of any dtype is replaced by an empty array of `layout.index`.
 * Throws `invalid_type` otherwise.
 */
array validate_index(array value, std::string_view name, const array_layout& layout);

/// Throws `invalid_type` if `value` is a null array.
array validate_content(array value, std::string_view name);

/// Throws `invalid_type` if `value` is outside the range of the integral dtype of a non-empty `index`.
void validate_sentinel(const array& index, int64_t value, std::string_view name);

/// Reads `index[position]` as a signed integer.
inline int64_t index_at(const array& index, int64_t position)
{
    return index.get(position).value<int64_t>();
}

} // namespace ragged::impl
