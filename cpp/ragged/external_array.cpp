#include "external_array.hpp"

#include <algorithm>

namespace ragged {

external_array::external_array(enum dtype dtype, ragged::shape shape, read_t read, write_t write)
    : read_(std::move(read))
    , write_(std::move(write))
{
    set_dtype(dtype);
    set_shape(std::move(shape));
}

void external_array::set_dtype(enum dtype value)
{
    if (value == dtype::unknown) {
        throw unknown_dtype();
    }
    dtype_ = value;
}

void external_array::set_shape(ragged::shape value)
{
    if (value.empty() || std::any_of(value.begin(), value.end(), [](int64_t d) {
            return d < 0;
        })) {
        throw invalid_shape(value.to_string());
    }
    shape_ = std::move(value);
}

array external_array::read(const selection& where) const
{
    if (!read_) {
        throw invalid_operation("external array has no read method");
    }
    return read_(where);
}

void external_array::write(const selection& where, const array& value) const
{
    if (!write_) {
        throw invalid_operation("external array has no write method");
    }
    write_(where, value);
}

} // namespace ragged
