#include "record_array.hpp"

#include <algorithm>

namespace ragged::impl {

record_array::record_array(columns_t columns)
    : columns_(std::move(columns))
{
    if (columns_.empty()) {
        shape_ = ragged::shape(0);
        return;
    }
    for (const auto& [name, column] : columns_) {
        if (!column) {
            throw invalid_type(fmt::format("Column '{}' must be an array.", name));
        }
    }
    const auto& first = columns_.front().second;
    auto scalar = first.dimensions() == 0;
    shape_ = scalar ? ragged::shape() : ragged::shape(first.size());
    for (const auto& [name, column] : columns_) {
        if ((column.dimensions() == 0) != scalar || (!scalar && column.size() != shape_[0])) {
            throw shape_mismatch(fmt::format("Column '{}'", name),
                                 column.shape().to_string(),
                                 fmt::format("column '{}'", columns_.front().first),
                                 first.shape().to_string());
        }
    }
}

array record_array::get(int64_t index) const
{
    return transform([index](const array& c) {
        return c.get(index);
    });
}

array record_array::slice(const ragged::slice& s) const
{
    return transform([&s](const array& c) {
        return c.slice(s);
    });
}

array record_array::take(const array& positions) const
{
    return transform([&positions](const array& c) {
        return c.take(positions);
    });
}

array record_array::field(std::string_view name) const
{
    return column(name);
}

std::vector<std::string> record_array::fields() const
{
    std::vector<std::string> result;
    result.reserve(columns_.size());
    for (const auto& [name, column] : columns_) {
        result.push_back(name);
    }
    return result;
}

void record_array::set(int64_t index, const array& value)
{
    if (!value || value.dtype() != dtype::record) {
        throw invalid_type("Only records can be assigned to a record array.");
    }
    for (auto& [name, c] : columns_) {
        c.set(index, value.field(name));
    }
}

void record_array::put(const array& positions, const array& values)
{
    if (!values || values.dtype() != dtype::record) {
        throw invalid_type("Only records can be assigned to a record array.");
    }
    for (auto& [name, c] : columns_) {
        c.put(positions, values.field(name));
    }
}

bool record_array::writeable() const
{
    return std::ranges::all_of(columns_, [](const auto& c) {
        return c.second.writeable();
    });
}

void record_array::set_writeable(bool value)
{
    for (auto& [name, c] : columns_) {
        c.set_writeable(value);
    }
}

const array& record_array::column(std::string_view name) const
{
    auto it = std::ranges::find_if(columns_, [name](const auto& c) {
        return c.first == name;
    });
    if (it == columns_.end()) {
        throw invalid_operation(fmt::format("Record has no field '{}'.", name));
    }
    return it->second;
}

} // namespace ragged::impl
