#include "index_view.hpp"
#include "impl/validate.hpp"

namespace ragged {

index_view::index_view(array index, array content, bool writeable, array_layout layout)
    : writeable_(writeable)
    , layout_(layout)
{
    layout_.validate();
    set_index(std::move(index));
    set_content(std::move(content));
}

void index_view::set_index(array value)
{
    index_ = impl::validate_index(std::move(value), "index", layout_);
}

void index_view::set_content(array value)
{
    content_ = impl::validate_content(std::move(value), "content");
}

ragged::shape index_view::shape() const
{
    return content_.shape().tail().prepend(index_.size());
}

array index_view::get(int64_t position) const
{
    return content_.get(impl::index_at(index_, position));
}

array index_view::slice(const ragged::slice& s) const
{
    return content_.take(index_.slice(s));
}

array index_view::take(const array& positions) const
{
    return content_.take(index_.take(positions));
}

index_view index_view::column(std::string_view name) const
{
    return index_view(index_, content_.field(name), writeable_, layout_);
}

void index_view::set(int64_t position, const array& value)
{
    check_writeable();
    content_.set(impl::index_at(index_, position), value);
}

void index_view::set(const ragged::slice& s, const array& value)
{
    check_writeable();
    content_.put(index_.slice(s), value);
}

void index_view::put(const array& positions, const array& values)
{
    check_writeable();
    content_.put(index_.take(positions), values);
}

void index_view::set(std::string_view name, const array& value)
{
    column(name).set(ragged::slice::all(), value);
}

void index_view::check_writeable() const
{
    if (!writeable_) {
        throw read_only();
    }
}

} // namespace ragged
