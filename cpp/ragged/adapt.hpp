#pragma once

/**
 * @file adapt.hpp
 * @brief Definitions and implementations of `adapt`, `empty`, `arange`, `record`, `none` and byte reinterpretation
 * functions.
 */

#include "array.hpp"
#include "impl/dense_array.hpp"

#include <cstring>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ragged {

template <numeric T>
array adapt(T value)
{
    auto buffer = std::make_shared<impl::dense_array::storage>();
    buffer->bytes.resize(sizeof(T));
    std::memcpy(buffer->bytes.data(), &value, sizeof(T));
    return array(impl::dense_array(std::move(buffer), dtype_enum_v<T>, shape()));
}

template <numeric T>
inline array adapt(const std::vector<T>& value, shape sh)
{
    if (sh.volume() != static_cast<int64_t>(value.size())) {
        throw invalid_shape(sh.to_string());
    }
    auto buffer = std::make_shared<impl::dense_array::storage>();
    buffer->bytes.resize(value.size() * sizeof(T));
    for (std::size_t i = 0; i < value.size(); ++i) {
        T v = value[i];
        std::memcpy(buffer->bytes.data() + i * sizeof(T), &v, sizeof(T));
    }
    return array(impl::dense_array(std::move(buffer), dtype_enum_v<T>, std::move(sh)));
}

template <numeric T>
inline array adapt(const std::vector<T>& value)
{
    return adapt(value, shape(value.size()));
}

template <numeric T>
inline array adapt(std::initializer_list<T> value)
{
    return adapt(std::vector<T>(value));
}

/// Zero filled array.
array empty(dtype type, shape sh);

/// `[0, 1, ..., count - 1]` of the given dtype.
array arange(dtype type, int64_t count);

/// Record array of named, equal length columns.
array record(std::vector<std::pair<std::string, array>> columns);

/// The canonical missing value.
array none();

/**
 * @brief Views the bytes of a contiguous dense array as an array of `type` sharing the same buffer.
 *
 * The total byte size must be a multiple of the itemsize of `type`. The result is 1-D.
 */
array reinterpret(const array& arr, dtype type);

/// Dense copy of `arr` with every element converted to `type`.
array astype(const array& arr, dtype type);

/// Dense copy of any array with the same dtype and shape.
array ascontiguous(const array& arr);

/**
 * @brief Flat byte view over the storage of `arr`.
 *
 * Contiguous dense arrays are viewed in place, anything else is copied first. The result has its own
 * writeable flag, initialized from `arr`.
 */
array as_bytes(const array& arr, dtype byte_type = dtype::uint8);

} // namespace ragged
