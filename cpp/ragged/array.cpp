#include "array.hpp"
#include "adapt.hpp"

namespace ragged::impl {

std::vector<int64_t> resolve_positions(const array& positions, int64_t length)
{
    if (!positions) {
        throw invalid_type("positions must be an array");
    }
    if (positions.dimensions() != 1) {
        throw invalid_type("positions must have 1-dimensional shape");
    }
    auto n = positions.size();
    std::vector<int64_t> result;
    if (positions.dtype() == dtype::boolean) {
        if (n != length) {
            throw length_mismatch(n, length);
        }
        for (int64_t i = 0; i < n; ++i) {
            if (positions.value<bool>(i)) {
                result.push_back(i);
            }
        }
        return result;
    }
    if (n > 0 && !dtype_is_integral(positions.dtype())) {
        throw invalid_type("positions must have integer dtype");
    }
    result.reserve(static_cast<std::size_t>(n));
    for (int64_t i = 0; i < n; ++i) {
        auto p = positions.value<int64_t>(i);
        auto q = p < 0 ? p + length : p;
        if (q < 0 || q >= length) {
            throw index_out_of_bounds(p, length);
        }
        result.push_back(q);
    }
    return result;
}

array positions_array(const slice::resolved& s)
{
    std::vector<int64_t> result(static_cast<std::size_t>(s.count));
    for (int64_t i = 0; i < s.count; ++i) {
        result[static_cast<std::size_t>(i)] = s[i];
    }
    return adapt(result);
}

void broadcast_assign(int64_t count,
                      uint32_t target_dimensions,
                      const array& values,
                      const std::function<void(int64_t, const array&)>& assign)
{
    if (!values) {
        throw invalid_type("Assigned value must be an array.");
    }
    if (values.is_none() || values.dimensions() < target_dimensions) {
        for (int64_t k = 0; k < count; ++k) {
            assign(k, values);
        }
        return;
    }
    auto n = values.size();
    if (n == count) {
        for (int64_t k = 0; k < count; ++k) {
            assign(k, values.get(k));
        }
    } else if (n == 1) {
        auto v = values.get(0);
        for (int64_t k = 0; k < count; ++k) {
            assign(k, v);
        }
    } else {
        throw length_mismatch(n, count);
    }
}

} // namespace ragged::impl
