#include "nullable_index_view.hpp"
#include "adapt.hpp"
#include "impl/validate.hpp"
#include "overloads.hpp"

namespace ragged {

nullable_index_view::nullable_index_view(array index,
                                         array content,
                                         int64_t masked_when,
                                         bool writeable,
                                         array_layout layout)
    : index_view(std::move(index), std::move(content), writeable, layout)
    , masked_when_(masked_when)
{
    impl::validate_sentinel(index_, masked_when_, "masked_when");
}

void nullable_index_view::set_masked_when(int64_t value)
{
    impl::validate_sentinel(index_, value, "masked_when");
    masked_when_ = value;
}

void nullable_index_view::set_index(array value)
{
    auto validated = impl::validate_index(std::move(value), "index", layout_);
    impl::validate_sentinel(validated, masked_when_, "masked_when");
    index_ = std::move(validated);
}

bool nullable_index_view::is_missing(int64_t position) const
{
    return impl::index_at(index_, position) == masked_when_;
}

array nullable_index_view::mask() const
{
    auto n = size();
    auto result = empty(dtype::boolean, ragged::shape(n));
    for (int64_t i = 0; i < n; ++i) {
        result.set(i, is_missing(i));
    }
    return result;
}

masked_source nullable_index_view::to_masked_source() const
{
    return masked_source(array(*this), mask(), true);
}

array nullable_index_view::get(int64_t position) const
{
    auto i = impl::index_at(index_, position);
    if (i == masked_when_) {
        return none();
    }
    return content_.get(i);
}

array nullable_index_view::slice(const ragged::slice& s) const
{
    return array(nullable_index_view(index_.slice(s), content_, masked_when_, writeable_, layout_));
}

array nullable_index_view::take(const array& positions) const
{
    return array(nullable_index_view(index_.take(positions), content_, masked_when_, writeable_, layout_));
}

nullable_index_view nullable_index_view::column(std::string_view name) const
{
    return nullable_index_view(index_, content_.field(name), masked_when_, writeable_, layout_);
}

void nullable_index_view::set(int64_t position, const write_operand& what)
{
    auto n = size();
    auto p = position < 0 ? position + n : position;
    if (p < 0 || p >= n) {
        throw index_out_of_bounds(position, n);
    }
    write({p}, true, what);
}

void nullable_index_view::set(const ragged::slice& s, const write_operand& what)
{
    write(impl::resolve_positions(impl::positions_array(s.resolve(size())), size()), false, what);
}

void nullable_index_view::put(const array& positions, const write_operand& what)
{
    write(impl::resolve_positions(positions, size()), false, what);
}

void nullable_index_view::set(std::string_view name, const write_operand& what)
{
    column(name).set(ragged::slice::all(), what);
}

void nullable_index_view::write(const std::vector<int64_t>& targets, bool scalar_target, const write_operand& what)
{
    check_writeable();
    auto count = static_cast<int64_t>(targets.size());
    auto assign = [&](int64_t k, const array& value) {
        auto t = targets[static_cast<std::size_t>(k)];
        if (value.is_none()) {
            index_.set(t, masked_when_);
            return;
        }
        auto i = impl::index_at(index_, t);
        if (i != masked_when_) {
            content_.set(i, value);
        }
    };
    auto repeat = [&](const array& value) {
        for (int64_t k = 0; k < count; ++k) {
            assign(k, value);
        }
    };
    std::visit(overloads{[&](const missing_t&) {
                             repeat(none());
                         },
                         [&](const singleton& s) {
                             repeat(to_array(s.value()));
                         },
                         [&](const array& a) {
                             if (scalar_target) {
                                 repeat(a);
                             } else {
                                 impl::broadcast_assign(count, content_.dimensions(), a, assign);
                             }
                         },
                         [&](const masked_source& m) {
                             if (m.size() != count) {
                                 throw length_mismatch(m.size(), count);
                             }
                             for (int64_t k = 0; k < count; ++k) {
                                 assign(k, m.at(k));
                             }
                         },
                         [&](const marked_sequence& seq) {
                             auto n = static_cast<int64_t>(seq.size());
                             if (n == 1) {
                                 repeat(to_array(seq.front()));
                             } else if (n == count) {
                                 for (int64_t k = 0; k < count; ++k) {
                                     assign(k, to_array(seq[static_cast<std::size_t>(k)]));
                                 }
                             } else {
                                 throw length_mismatch(n, count);
                             }
                         }},
               what);
}

} // namespace ragged
