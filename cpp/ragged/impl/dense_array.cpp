#include "dense_array.hpp"

#include <cstring>

namespace ragged::impl {

dense_array::dense_array(std::shared_ptr<storage> buffer, enum dtype dtype, ragged::shape shape)
    : buffer_(std::move(buffer))
    , dtype_(dtype)
    , shape_(std::move(shape))
    , itemsize_(static_cast<int64_t>(dtype_bytes(dtype)))
{
    step_ = row_volume();
    RAGGED_ASSERT(static_cast<int64_t>(buffer_->bytes.size()) >= shape_.volume() * itemsize_);
}

dense_array::dense_array(std::shared_ptr<storage> buffer,
                         enum dtype dtype,
                         ragged::shape shape,
                         int64_t offset,
                         int64_t step,
                         bool writeable)
    : buffer_(std::move(buffer))
    , dtype_(dtype)
    , shape_(std::move(shape))
    , offset_(offset)
    , step_(step)
    , itemsize_(static_cast<int64_t>(dtype_bytes(dtype)))
    , writeable_(writeable)
{
}

bool dense_array::is_contiguous() const noexcept
{
    return shape_.empty() || shape_[0] <= 1 || step_ == row_volume();
}

std::span<const uint8_t> dense_array::data() const
{
    if (!is_contiguous()) {
        throw invalid_operation("data() requires a contiguous array.");
    }
    return std::span<const uint8_t>(address(offset_), static_cast<std::size_t>(shape_.volume() * itemsize_));
}

int64_t dense_array::element_index(int64_t flat) const noexcept
{
    if (shape_.empty()) {
        return offset_;
    }
    auto rv = row_volume();
    return offset_ + (flat / rv) * step_ + flat % rv;
}

element_value dense_array::element(int64_t index) const
{
    element_value result;
    result.dtype = dtype_;
    std::memcpy(result.bytes.data(), address(element_index(index)), static_cast<std::size_t>(itemsize_));
    return result;
}

array dense_array::get(int64_t index) const
{
    if (shape_.empty()) {
        throw invalid_operation("Too many indices for a scalar array.");
    }
    auto tail = shape_.tail();
    auto step = tail.empty() ? 0 : tail.tail().volume();
    return array(dense_array(buffer_, dtype_, std::move(tail), offset_ + index * step_, step, writeable_));
}

array dense_array::slice(const ragged::slice& s) const
{
    if (shape_.empty()) {
        throw invalid_operation("Can't slice a scalar array.");
    }
    auto r = s.resolve(shape_[0]);
    auto sh = shape_;
    sh[0] = r.count;
    auto offset = r.count == 0 ? offset_ : offset_ + r.start * step_;
    return array(dense_array(buffer_, dtype_, std::move(sh), offset, step_ * r.step, writeable_));
}

array dense_array::take(const array& positions) const
{
    if (shape_.empty()) {
        throw invalid_operation("Can't index a scalar array.");
    }
    auto p = resolve_positions(positions, shape_[0]);
    auto row_bytes = static_cast<std::size_t>(row_volume() * itemsize_);
    auto result = std::make_shared<storage>();
    result->bytes.resize(p.size() * row_bytes);
    auto* out = result->bytes.data();
    for (auto row : p) {
        std::memcpy(out, address(offset_ + row * step_), row_bytes);
        out += row_bytes;
    }
    auto sh = shape_;
    sh[0] = static_cast<int64_t>(p.size());
    return array(dense_array(std::move(result), dtype_, std::move(sh)));
}

void dense_array::set(int64_t index, const array& value)
{
    check_writeable();
    if (shape_.empty()) {
        throw invalid_operation("Can't index a scalar array.");
    }
    if (!value) {
        throw invalid_type("Assigned value must be an array.");
    }
    auto base = offset_ + index * step_;
    auto rv = row_volume();
    auto vv = value.volume();
    if (vv == 1) {
        auto e = value.element(0);
        for (int64_t j = 0; j < rv; ++j) {
            write_element(base + j, e);
        }
    } else if (vv == rv) {
        for (int64_t j = 0; j < rv; ++j) {
            write_element(base + j, value.element(j));
        }
    } else {
        throw length_mismatch(vv, rv);
    }
}

void dense_array::put(const array& positions, const array& values)
{
    check_writeable();
    if (shape_.empty()) {
        throw invalid_operation("Can't index a scalar array.");
    }
    auto p = resolve_positions(positions, shape_[0]);
    broadcast_assign(static_cast<int64_t>(p.size()),
                     static_cast<uint32_t>(shape_.size()),
                     values,
                     [this, &p](int64_t k, const array& v) {
                         set(p[static_cast<std::size_t>(k)], v);
                     });
}

void dense_array::write_element(int64_t element_index, const element_value& value)
{
    switch_numeric_dtype(dtype_, [&]<typename T>() {
        T v = value.as<T>();
        std::memcpy(address(element_index), &v, sizeof(T));
    });
}

void dense_array::check_writeable() const
{
    if (!writeable_) {
        throw read_only();
    }
}

} // namespace ragged::impl
