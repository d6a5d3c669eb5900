#include "tagged_union_view.hpp"
#include "adapt.hpp"
#include "impl/validate.hpp"

#include <map>
#include <set>

namespace ragged {

tagged_union_view::tagged_union_view(array tags,
                                     array index,
                                     std::vector<array> contents,
                                     bool writeable,
                                     array_layout layout)
    : writeable_(writeable)
    , layout_(layout)
{
    layout_.validate();
    set_tags(std::move(tags));
    set_index(std::move(index));
    set_contents(std::move(contents));
}

void tagged_union_view::set_tags(array value)
{
    tags_ = impl::validate_index(std::move(value), "tags", layout_);
}

void tagged_union_view::set_index(array value)
{
    index_ = impl::validate_index(std::move(value), "index", layout_);
}

void tagged_union_view::set_contents(std::vector<array> value)
{
    for (auto& c : value) {
        c = impl::validate_content(std::move(c), "each content");
    }
    contents_ = std::move(value);
}

void tagged_union_view::check_shapes() const
{
    auto t = tags_.shape();
    auto i = index_.shape();
    if (!(t == i)) {
        throw shape_mismatch("tags", t.to_string(), "index", i.to_string());
    }
}

array& tagged_union_view::content_for(int64_t tag)
{
    auto n = static_cast<int64_t>(contents_.size());
    if (tag < 0 || tag >= n) {
        throw index_out_of_bounds(tag, n);
    }
    return contents_[static_cast<std::size_t>(tag)];
}

const array& tagged_union_view::content_for(int64_t tag) const
{
    auto n = static_cast<int64_t>(contents_.size());
    if (tag < 0 || tag >= n) {
        throw index_out_of_bounds(tag, n);
    }
    return contents_[static_cast<std::size_t>(tag)];
}

array tagged_union_view::get(int64_t position) const
{
    check_shapes();
    auto tag = impl::index_at(tags_, position);
    return content_for(tag).get(impl::index_at(index_, position));
}

array tagged_union_view::slice(const ragged::slice& s) const
{
    check_shapes();
    return select(tags_.slice(s), index_.slice(s));
}

array tagged_union_view::take(const array& positions) const
{
    check_shapes();
    return select(tags_.take(positions), index_.take(positions));
}

array tagged_union_view::select(array tags, array index) const
{
    auto values = tags.to_vector<int64_t>();
    std::set<int64_t> distinct(values.begin(), values.end());
    if (distinct.size() == 1) {
        return content_for(*distinct.begin()).take(index);
    }
    return array(tagged_union_view(std::move(tags), std::move(index), contents_, writeable_, layout_));
}

tagged_union_view tagged_union_view::column(std::string_view name) const
{
    std::vector<array> projected;
    projected.reserve(contents_.size());
    for (const auto& c : contents_) {
        projected.push_back(c.field(name));
    }
    return tagged_union_view(tags_, index_, std::move(projected), writeable_, layout_);
}

void tagged_union_view::set(int64_t position, const array& value)
{
    auto n = size();
    auto p = position < 0 ? position + n : position;
    if (p < 0 || p >= n) {
        throw index_out_of_bounds(position, n);
    }
    write({p}, true, value);
}

void tagged_union_view::set(const ragged::slice& s, const array& value)
{
    write(impl::resolve_positions(impl::positions_array(s.resolve(size())), size()), false, value);
}

void tagged_union_view::put(const array& positions, const array& values)
{
    write(impl::resolve_positions(positions, size()), false, values);
}

void tagged_union_view::set(std::string_view name, const array& value)
{
    column(name).set(ragged::slice::all(), value);
}

void tagged_union_view::write(const std::vector<int64_t>& targets, bool scalar_target, const array& what)
{
    if (!writeable_) {
        throw read_only();
    }
    check_shapes();
    if (!what) {
        throw invalid_type("Assigned value must be an array.");
    }
    auto count = static_cast<int64_t>(targets.size());
    auto broadcast = scalar_target || what.dimensions() == 0;
    if (!broadcast && what.size() != 1 && what.size() != count) {
        throw length_mismatch(what.size(), count);
    }
    auto repeated = !broadcast && what.size() == 1;

    std::map<int64_t, std::vector<int64_t>> groups;
    for (int64_t k = 0; k < count; ++k) {
        groups[impl::index_at(tags_, targets[static_cast<std::size_t>(k)])].push_back(k);
    }
    for (const auto& [tag, ks] : groups) {
        auto& content = content_for(tag);
        for (auto k : ks) {
            auto i = impl::index_at(index_, targets[static_cast<std::size_t>(k)]);
            content.set(i, broadcast ? what : what.get(repeated ? 0 : k));
        }
    }
}

} // namespace ragged
