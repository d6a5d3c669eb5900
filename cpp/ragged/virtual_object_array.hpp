#pragma once

/**
 * @file virtual_object_array.hpp
 * @brief Definition of the `virtual_object_array` class template.
 */

#include "array.hpp"
#include "function.hpp"

#include <vector>

namespace ragged {

/**
 * @brief Read-only array of objects computed on access: element `i` is `generator(content[i])`.
 *
 * Nothing is stored, every read calls the generator again.
 */
template <typename T>
class virtual_object_array
{
public:
    using generator_t = function<T(const array&) const>;

public:
    virtual_object_array(generator_t generator, array content)
    {
        set_generator(std::move(generator));
        set_content(std::move(content));
    }

    void set_generator(generator_t generator)
    {
        if (!generator) {
            throw invalid_type("generator must be callable");
        }
        generator_ = std::move(generator);
    }

    const array& content() const noexcept
    {
        return content_;
    }

    void set_content(array content)
    {
        if (!content || content.dimensions() == 0) {
            throw invalid_type("content must be an array with at least one dimension");
        }
        content_ = std::move(content);
    }

    enum dtype dtype() const noexcept
    {
        return dtype::object;
    }

    ragged::shape shape() const
    {
        return content_.shape();
    }

    int64_t size() const
    {
        return content_.size();
    }

    bool writeable() const noexcept
    {
        return false;
    }

    T get(int64_t position) const
    {
        return generator_(content_.get(position));
    }

    std::vector<T> slice(const ragged::slice& s) const
    {
        return apply(content_.slice(s));
    }

    std::vector<T> take(const array& positions) const
    {
        return apply(content_.take(positions));
    }

    void set(int64_t, const array&)
    {
        throw read_only();
    }

private:
    std::vector<T> apply(const array& selected) const
    {
        auto n = selected.size();
        std::vector<T> result;
        result.reserve(static_cast<std::size_t>(n));
        for (int64_t i = 0; i < n; ++i) {
            result.push_back(generator_(selected.get(i)));
        }
        return result;
    }

private:
    generator_t generator_;
    array content_;
};

} // namespace ragged
