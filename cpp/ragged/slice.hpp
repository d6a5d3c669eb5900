#pragma once

/**
 * @file slice.hpp
 * @brief Definition of the `slice` class.
 */

#include "exceptions.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>

namespace ragged {

/**
 * @brief Python style `start:stop:step` selection along the first axis.
 *
 * Start and stop are optional and may be negative, they are resolved against a length by `resolve()`.
 */
class slice
{
public:
    struct resolved
    {
        int64_t start;
        int64_t step;
        int64_t count;

        int64_t operator[](int64_t i) const noexcept
        {
            return start + i * step;
        }
    };

public:
    constexpr slice(std::optional<int64_t> start, std::optional<int64_t> stop, int64_t step = 1) noexcept
        : start_(start)
        , stop_(stop)
        , step_(step)
    {
    }

    constexpr static slice all() noexcept
    {
        return slice({}, {});
    }

    constexpr static slice range(int64_t start, int64_t stop) noexcept
    {
        return slice(start, stop);
    }

    const std::optional<int64_t>& start() const noexcept
    {
        return start_;
    }

    const std::optional<int64_t>& stop() const noexcept
    {
        return stop_;
    }

    int64_t step() const noexcept
    {
        return step_;
    }

    /// Resolves the slice against an axis of `length` elements, clamping like numpy does.
    resolved resolve(int64_t length) const
    {
        if (step_ == 0) {
            throw invalid_operation("slice step cannot be zero");
        }
        int64_t start = 0;
        int64_t stop = 0;
        if (step_ > 0) {
            start = clamp(start_, length, 0, 0, length);
            stop = clamp(stop_, length, length, 0, length);
        } else {
            start = clamp(start_, length, length - 1, -1, length - 1);
            stop = clamp(stop_, length, -1, -1, length - 1);
        }
        int64_t count = 0;
        if (step_ > 0 && stop > start) {
            count = (stop - start + step_ - 1) / step_;
        } else if (step_ < 0 && stop < start) {
            count = (start - stop - step_ - 1) / -step_;
        }
        return resolved{start, step_, count};
    }

private:
    static int64_t clamp(const std::optional<int64_t>& v, int64_t length, int64_t fallback, int64_t lo, int64_t hi)
    {
        if (!v) {
            return fallback;
        }
        auto x = *v < 0 ? *v + length : *v;
        return std::clamp(x, lo, hi);
    }

private:
    std::optional<int64_t> start_;
    std::optional<int64_t> stop_;
    int64_t step_;
};

} // namespace ragged
