#pragma once

/**
 * @file cache.hpp
 * @brief Definitions of cache keys, the `array_cache` interface and the in-memory cache.
 */

#include "array.hpp"
#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace ragged {

/**
 * @brief Key generated for an object that has no persistent key. Unique among live keys of its arena.
 */
struct transient_key
{
    uint64_t id = 0;

    bool operator==(const transient_key&) const noexcept = default;
};

using cache_key = std::variant<std::string, transient_key>;

std::string key_to_string(const cache_key& key);

struct cache_key_hash
{
    std::size_t operator()(const cache_key& key) const noexcept;
};

/**
 * @brief Mutable mapping from keys to materialized arrays.
 *
 * Entries may disappear at any time (eviction, external `erase`). Readers must treat a missing entry as
 * a cache miss.
 */
class array_cache
{
public:
    virtual ~array_cache() = default;

    virtual std::optional<array> find(const cache_key& key) const = 0;

    virtual void insert(const cache_key& key, array value) = 0;

    /// Removes the entry. Returns false when there was none.
    virtual bool erase(const cache_key& key) = 0;

    bool contains(const cache_key& key) const
    {
        return find(key).has_value();
    }
};

/**
 * @brief Thread safe in-memory cache with optional FIFO eviction.
 *
 * With a capacity of 0 the cache is unbounded.
 */
class memory_cache final : public array_cache
{
public:
    explicit memory_cache(std::size_t capacity = 0);

    std::optional<array> find(const cache_key& key) const override;

    void insert(const cache_key& key, array value) override;

    bool erase(const cache_key& key) override;

    std::size_t size() const;

    std::size_t capacity() const noexcept
    {
        return capacity_;
    }

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<cache_key, array, cache_key_hash> entries_;
    std::deque<cache_key> order_;
    std::size_t capacity_;
};

/// In-memory cache bounded by `c.cache_capacity`.
std::shared_ptr<memory_cache> make_memory_cache(const config& c);

} // namespace ragged
