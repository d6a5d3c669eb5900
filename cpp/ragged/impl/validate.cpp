#include "validate.hpp"
#include "../adapt.hpp"
#include "../switch_dtype.hpp"

#include <type_traits>
#include <utility>

namespace ragged::impl {

array validate_index(array value, std::string_view name, const array_layout& layout)
{
    if (!value || value.is_none()) {
        throw invalid_type(fmt::format("{} must be an array", name));
    }
    if (value.dimensions() != 1) {
        throw invalid_type(fmt::format("{} must have 1-dimensional shape", name));
    }
    if (value.size() == 0) {
        return empty(layout.index, shape(0));
    }
    if (!dtype_is_integral(value.dtype())) {
        throw invalid_type(fmt::format("{} must have integer dtype", name));
    }
    return value;
}

array validate_content(array value, std::string_view name)
{
    if (!value || value.is_none()) {
        throw invalid_type(fmt::format("{} must be an array", name));
    }
    return value;
}

void validate_sentinel(const array& index, int64_t value, std::string_view name)
{
    if (index.size() == 0) {
        return;
    }
    auto fits = switch_numeric_dtype(index.dtype(), [value]<typename T>() {
        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
            return std::in_range<T>(value);
        } else {
            return false;
        }
    });
    if (!fits) {
        throw invalid_type(
            fmt::format("{} {} does not fit an index of dtype {}", name, value, dtype_to_str(index.dtype())));
    }
}

} // namespace ragged::impl
