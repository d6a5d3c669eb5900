#pragma once

/**
 * @file key_arena.hpp
 * @brief Definitions of `key_arena` and `scoped_transient_key`.
 */

#include "cache.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace ragged {

/**
 * @brief Issues transient keys from a monotonic counter and tracks which of them are live.
 *
 * Ids are never reused, so a released key can not alias a key issued later.
 */
class key_arena
{
public:
    key_arena() = default;

    key_arena(const key_arena&) = delete;
    key_arena& operator=(const key_arena&) = delete;

    transient_key acquire();

    void release(transient_key key) noexcept;

    bool is_live(transient_key key) const;

    std::size_t live_count() const;

    /// Process wide arena used by default.
    static key_arena& global();

private:
    std::atomic<uint64_t> next_{1};
    mutable std::mutex mutex_;
    std::unordered_set<uint64_t> live_;
};

/**
 * @brief Owner of one transient key.
 *
 * On destruction the key's entry is erased from the bound cache and the key is released from its arena.
 */
class scoped_transient_key
{
public:
    scoped_transient_key(key_arena& arena, std::shared_ptr<array_cache> cache);

    scoped_transient_key(const scoped_transient_key&) = delete;
    scoped_transient_key& operator=(const scoped_transient_key&) = delete;

    scoped_transient_key(scoped_transient_key&& other) noexcept;
    scoped_transient_key& operator=(scoped_transient_key&& other) noexcept;

    ~scoped_transient_key();

    transient_key key() const noexcept
    {
        return key_;
    }

    /// Erases the entry from the current cache, then binds the key to `cache`.
    void rebind(std::shared_ptr<array_cache> cache);

private:
    void erase_entry() noexcept;

    void reset() noexcept;

private:
    key_arena* arena_;
    std::shared_ptr<array_cache> cache_;
    transient_key key_;
};

} // namespace ragged
