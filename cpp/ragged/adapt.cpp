#include "adapt.hpp"
#include "impl/none_array.hpp"
#include "impl/record_array.hpp"

namespace ragged {

array empty(dtype type, shape sh)
{
    auto buffer = std::make_shared<impl::dense_array::storage>();
    buffer->bytes.resize(static_cast<std::size_t>(sh.volume()) * dtype_bytes(type));
    return array(impl::dense_array(std::move(buffer), type, std::move(sh)));
}

array arange(dtype type, int64_t count)
{
    auto result = empty(type, shape(count));
    for (int64_t i = 0; i < count; ++i) {
        result.set(i, i);
    }
    return result;
}

array record(std::vector<std::pair<std::string, array>> columns)
{
    return array(impl::record_array(std::move(columns)));
}

array none()
{
    static const array value{impl::none_array()};
    return value;
}

array reinterpret(const array& arr, dtype type)
{
    const auto* dense = arr.dynamic_cast_<impl::dense_array>();
    if (dense == nullptr || !dense->is_contiguous()) {
        throw invalid_operation("reinterpret() requires a contiguous dense array.");
    }
    auto bytes = static_cast<int64_t>(dense->data().size());
    auto itemsize = static_cast<int64_t>(dtype_bytes(type));
    if (bytes % itemsize != 0) {
        throw invalid_operation(fmt::format("Can't view {} bytes as {} with itemsize {}.",
                                            bytes, dtype_to_str(type), itemsize));
    }
    auto offset_bytes = dense->offset() * dense->itemsize();
    if (offset_bytes % itemsize != 0) {
        throw invalid_operation(fmt::format("Array offset of {} bytes is not aligned to {}.",
                                            offset_bytes, dtype_to_str(type)));
    }
    return array(impl::dense_array(dense->owner(),
                                   type,
                                   shape(bytes / itemsize),
                                   offset_bytes / itemsize,
                                   1,
                                   dense->writeable()));
}

array astype(const array& arr, dtype type)
{
    auto itemsize = dtype_bytes(type);
    auto v = arr.volume();
    auto buffer = std::make_shared<impl::dense_array::storage>();
    buffer->bytes.resize(static_cast<std::size_t>(v) * itemsize);
    for (int64_t i = 0; i < v; ++i) {
        auto e = arr.element(i);
        if (e.dtype != type) {
            e = switch_numeric_dtype(type, [&e]<typename T>() {
                return element_value::of(e.as<T>());
            });
        }
        std::memcpy(buffer->bytes.data() + static_cast<std::size_t>(i) * itemsize, e.bytes.data(), itemsize);
    }
    return array(impl::dense_array(std::move(buffer), type, arr.shape()));
}

array ascontiguous(const array& arr)
{
    return astype(arr, arr.dtype());
}

array as_bytes(const array& arr, dtype byte_type)
{
    if (byte_type != dtype::uint8 && byte_type != dtype::int8) {
        throw invalid_type(fmt::format("byte dtype must be uint8 or int8, got {}", dtype_to_str(byte_type)));
    }
    const auto* dense = arr.dynamic_cast_<impl::dense_array>();
    if (dense != nullptr && dense->is_contiguous()) {
        return reinterpret(arr, byte_type);
    }
    auto copy = ascontiguous(arr);
    auto result = reinterpret(copy, byte_type);
    result.set_writeable(arr.writeable());
    return result;
}

} // namespace ragged
