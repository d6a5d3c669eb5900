#pragma once

#include "exceptions.hpp"

namespace ragged {

template <typename F>
auto switch_numeric_dtype(dtype t, F f)
{
    switch (t) {
    case dtype::boolean:
        return f.template operator()<bool>();
    case dtype::uint8:
        return f.template operator()<uint8_t>();
    case dtype::uint16:
        return f.template operator()<uint16_t>();
    case dtype::uint32:
        return f.template operator()<uint32_t>();
    case dtype::uint64:
        return f.template operator()<uint64_t>();
    case dtype::int8:
        return f.template operator()<int8_t>();
    case dtype::int16:
        return f.template operator()<int16_t>();
    case dtype::int32:
        return f.template operator()<int32_t>();
    case dtype::int64:
        return f.template operator()<int64_t>();
    case dtype::float32:
        return f.template operator()<float>();
    case dtype::float64:
        return f.template operator()<double>();
    case dtype::record:
        throw non_numeric_dtype(dtype_to_str(dtype::record));
    case dtype::object:
        throw non_numeric_dtype(dtype_to_str(dtype::object));
    case dtype::unknown:
    default:
        throw unknown_dtype();
    }
}

/// Itemsize of a fixed-width dtype. Throws `non_numeric_dtype` for record/object.
inline std::size_t dtype_bytes(dtype type)
{
    return switch_numeric_dtype(type, []<typename T>() {
        return sizeof(T);
    });
}

} // namespace ragged
