#pragma once

/**
 * @file lazy_array.hpp
 * @brief Definition of the `lazy_array` class.
 */

#include "array.hpp"
#include "function.hpp"
#include "key_arena.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace ragged {

/**
 * @brief Array produced on first access by a generator.
 *
 * Without a cache the produced array is held directly. With a cache it is stored under the persistent
 * key (or a transient key owned by this object) and only the key is held, so an evicted entry is
 * regenerated on the next access. A transient entry is erased from the cache when the object is
 * destroyed.
 *
 * Declared dtype and shape, when given, are answered without materializing and are checked against the
 * produced array.
 */
class lazy_array
{
public:
    using generator_t = function<array()>;

public:
    explicit lazy_array(generator_t generator,
                        std::shared_ptr<array_cache> cache = nullptr,
                        std::optional<std::string> persistent_key = std::nullopt,
                        std::optional<enum dtype> dtype = std::nullopt,
                        std::optional<ragged::shape> shape = std::nullopt,
                        key_arena& arena = key_arena::global());

    lazy_array(const lazy_array&) = delete;
    lazy_array& operator=(const lazy_array&) = delete;
    lazy_array(lazy_array&&) noexcept = default;
    lazy_array& operator=(lazy_array&&) noexcept = default;
    ~lazy_array() = default;

    void set_generator(generator_t generator);

    const std::shared_ptr<array_cache>& cache() const noexcept
    {
        return cache_;
    }

    void set_cache(std::shared_ptr<array_cache> cache);

    const std::optional<std::string>& persistent_key() const noexcept
    {
        return persistent_key_;
    }

    void set_persistent_key(std::optional<std::string> key);

    /// The persistent key if set, otherwise the transient key of this object.
    cache_key key() const;

    bool is_materialized() const;

    /// The produced array, generating it when it is not held or was evicted.
    array value() const;

    /// Runs the generator unconditionally and stores the result.
    array materialize() const;

    enum dtype dtype() const;

    ragged::shape shape() const;

    int64_t size() const
    {
        return shape()[0];
    }

    array get(int64_t position) const
    {
        return value().get(position);
    }

    array slice(const ragged::slice& s) const
    {
        return value().slice(s);
    }

    array take(const array& positions) const
    {
        return value().take(positions);
    }

    array field(std::string_view name) const
    {
        return value().field(name);
    }

    std::vector<std::string> fields() const
    {
        return value().fields();
    }

    bool writeable() const noexcept
    {
        return false;
    }

    void set(int64_t, const array&)
    {
        throw read_only();
    }

    void put(const array&, const array&)
    {
        throw read_only();
    }

private:
    using held_t = std::variant<std::monostate, array, cache_key>;

    void store(const array& produced) const;

private:
    mutable generator_t generator_;
    std::shared_ptr<array_cache> cache_;
    std::optional<std::string> persistent_key_;
    std::optional<enum dtype> dtype_;
    std::optional<ragged::shape> shape_;
    key_arena* arena_;
    mutable std::optional<scoped_transient_key> transient_;
    mutable held_t held_;
};

} // namespace ragged
