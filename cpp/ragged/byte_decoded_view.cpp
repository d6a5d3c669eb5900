#include "byte_decoded_view.hpp"
#include "adapt.hpp"
#include "impl/validate.hpp"

#include <utility>

namespace ragged {

namespace {

/**
 * @brief Positions of every byte of the `itemsize` wide elements beginning at `starts`.
 *
 * The first vector holds the byte positions in the content, the second the matching positions in a
 * packed scratch buffer.
 */
std::pair<std::vector<int64_t>, std::vector<int64_t>> byte_positions(const std::vector<int64_t>& starts,
                                                                     int64_t itemsize)
{
    auto total = starts.size() * static_cast<std::size_t>(itemsize);
    std::vector<int64_t> contidx(total);
    std::vector<int64_t> holdidx(total);
    std::size_t at = 0;
    for (auto start : starts) {
        for (int64_t j = 0; j < itemsize; ++j, ++at) {
            contidx[at] = start + j;
            holdidx[at] = static_cast<int64_t>(at);
        }
    }
    return {std::move(contidx), std::move(holdidx)};
}

} // namespace

byte_decoded_view::byte_decoded_view(array index, array content, enum dtype dtype, bool writeable, array_layout layout)
    : dtype_(dtype)
    , writeable_(writeable)
    , layout_(layout)
{
    layout_.validate();
    set_index(std::move(index));
    set_content(std::move(content));
}

void byte_decoded_view::set_index(array value)
{
    index_ = impl::validate_index(std::move(value), "index", layout_);
}

void byte_decoded_view::set_content(array value)
{
    content_ = as_bytes(impl::validate_content(std::move(value), "content"), layout_.byte);
    content_.set_writeable(writeable_);
}

void byte_decoded_view::set_writeable(bool value)
{
    content_.set_writeable(value);
    writeable_ = value;
}

std::size_t byte_decoded_view::itemsize() const
{
    return dtype_bytes(dtype_);
}

std::vector<int64_t> byte_decoded_view::checked_offsets(const array& offsets) const
{
    auto s = static_cast<int64_t>(itemsize());
    auto n = content_.size();
    auto result = offsets.to_vector<int64_t>();
    for (auto o : result) {
        if (o < 0 || o > n - s) {
            throw index_out_of_bounds(o, n);
        }
    }
    return result;
}

array byte_decoded_view::get(int64_t position) const
{
    auto s = static_cast<int64_t>(itemsize());
    auto o = impl::index_at(index_, position);
    if (o < 0 || o > content_.size() - s) {
        throw index_out_of_bounds(o, content_.size());
    }
    auto scratch = ascontiguous(content_.slice(ragged::slice::range(o, o + s)));
    return reinterpret(scratch, dtype_).get(0);
}

array byte_decoded_view::slice(const ragged::slice& s) const
{
    return decode(index_.slice(s));
}

array byte_decoded_view::take(const array& positions) const
{
    return decode(index_.take(positions));
}

array byte_decoded_view::decode(const array& offsets) const
{
    auto s = static_cast<int64_t>(itemsize());
    auto starts = checked_offsets(offsets);
    auto k = static_cast<int64_t>(starts.size());
    if (k == 0) {
        return empty(dtype_, ragged::shape(0));
    }
    auto [contidx, holdidx] = byte_positions(starts, s);
    auto scratch = empty(layout_.byte, ragged::shape(k * s));
    scratch.put(adapt(holdidx), content_.take(adapt(contidx)));
    return reinterpret(scratch, dtype_);
}

void byte_decoded_view::set(int64_t position, const array& value)
{
    if (!writeable_) {
        throw read_only();
    }
    auto o = impl::index_at(index_, position);
    encode(adapt(std::vector<int64_t>{o}), value);
}

void byte_decoded_view::set(const ragged::slice& s, const array& value)
{
    if (!writeable_) {
        throw read_only();
    }
    encode(index_.slice(s), value);
}

void byte_decoded_view::put(const array& positions, const array& values)
{
    if (!writeable_) {
        throw read_only();
    }
    encode(index_.take(positions), values);
}

void byte_decoded_view::encode(const array& offsets, const array& values)
{
    auto s = static_cast<int64_t>(itemsize());
    auto starts = checked_offsets(offsets);
    auto k = static_cast<int64_t>(starts.size());
    if (k == 0) {
        return;
    }
    auto hold = empty(dtype_, ragged::shape(k));
    hold.put(arange(dtype::int64, k), values);
    auto [contidx, holdidx] = byte_positions(starts, s);
    auto bytes = reinterpret(hold, layout_.byte);
    content_.put(adapt(contidx), bytes.take(adapt(holdidx)));
}

} // namespace ragged
