#pragma once

#include "../array.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ragged::impl {

/**
 * @brief Named columns of equal length. A single row is a record of 0-d (or row shaped) columns.
 */
class record_array
{
public:
    using columns_t = std::vector<std::pair<std::string, array>>;

public:
    explicit record_array(columns_t columns);

    enum dtype dtype() const noexcept
    {
        return dtype::record;
    }

    ragged::shape shape() const
    {
        return shape_;
    }

    array get(int64_t index) const;

    array slice(const ragged::slice& s) const;

    array take(const array& positions) const;

    array field(std::string_view name) const;

    std::vector<std::string> fields() const;

    /// Assigns every field of `value` (a record) to the same named column.
    void set(int64_t index, const array& value);

    void put(const array& positions, const array& values);

    bool writeable() const;

    void set_writeable(bool value);

private:
    template <typename F>
    array transform(F f) const
    {
        columns_t result;
        result.reserve(columns_.size());
        for (const auto& [name, column] : columns_) {
            result.emplace_back(name, f(column));
        }
        return array(record_array(std::move(result)));
    }

    const array& column(std::string_view name) const;

private:
    columns_t columns_;
    ragged::shape shape_;
};

} // namespace ragged::impl
