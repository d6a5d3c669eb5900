#pragma once

#include "../array.hpp"

namespace ragged::impl {

/**
 * @brief The canonical missing value returned for masked positions.
 */
class none_array
{
public:
    enum dtype dtype() const noexcept
    {
        return dtype::unknown;
    }

    ragged::shape shape() const
    {
        return ragged::shape();
    }

    element_value element(int64_t) const
    {
        throw invalid_operation("Missing value has no elements.");
    }

    static constexpr bool is_none = true;
};

} // namespace ragged::impl
