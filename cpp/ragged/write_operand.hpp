#pragma once

/**
 * @file write_operand.hpp
 * @brief Values that can be written through a `nullable_index_view`.
 */

#include "array.hpp"

#include <utility>
#include <variant>
#include <vector>

namespace ragged {

/// Marker for a missing element.
struct missing_t
{
};

inline constexpr missing_t missing{};

/// One element of a marked sequence: either missing or a value.
using maybe_value = std::variant<missing_t, array>;

/// Converts a marked element to an array, `none()` for missing.
array to_array(const maybe_value& value);

/**
 * @brief Length-1 wrapper around a single value or marker, unwrapped and broadcast to every target.
 */
class singleton
{
public:
    explicit singleton(maybe_value value)
        : value_(std::move(value))
    {
    }

    const maybe_value& value() const noexcept
    {
        return value_;
    }

private:
    maybe_value value_;
};

/**
 * @brief Values paired with a boolean mask. Element `k` is missing when `mask[k] == masked_when`.
 */
class masked_source
{
public:
    masked_source(array content, array mask, bool masked_when = true);

    const array& content() const noexcept
    {
        return content_;
    }

    const array& mask() const noexcept
    {
        return mask_;
    }

    bool masked_when() const noexcept
    {
        return masked_when_;
    }

    int64_t size() const
    {
        return mask_.size();
    }

    bool is_missing(int64_t k) const;

    /// `content[k]`, or `none()` when the element is missing.
    array at(int64_t k) const;

private:
    array content_;
    array mask_;
    bool masked_when_;
};

/// Sequence whose elements are values or missing markers.
using marked_sequence = std::vector<maybe_value>;

/**
 * @brief Every kind of value accepted by a nullable write.
 *
 * A plain `array` carries no markers, except `none()` which stands for missing.
 */
using write_operand = std::variant<missing_t, array, singleton, masked_source, marked_sequence>;

} // namespace ragged
