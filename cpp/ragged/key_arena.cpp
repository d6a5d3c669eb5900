#include "key_arena.hpp"
#include "ragged.hpp"

#include <utility>

namespace ragged {

transient_key key_arena::acquire()
{
    transient_key key{next_.fetch_add(1, std::memory_order_relaxed)};
    std::lock_guard lock(mutex_);
    live_.insert(key.id);
    return key;
}

void key_arena::release(transient_key key) noexcept
{
    std::lock_guard lock(mutex_);
    live_.erase(key.id);
}

bool key_arena::is_live(transient_key key) const
{
    std::lock_guard lock(mutex_);
    return live_.contains(key.id);
}

std::size_t key_arena::live_count() const
{
    std::lock_guard lock(mutex_);
    return live_.size();
}

key_arena& key_arena::global()
{
    static key_arena arena;
    return arena;
}

scoped_transient_key::scoped_transient_key(key_arena& arena, std::shared_ptr<array_cache> cache)
    : arena_(&arena)
    , cache_(std::move(cache))
    , key_(arena.acquire())
{
}

scoped_transient_key::scoped_transient_key(scoped_transient_key&& other) noexcept
    : arena_(std::exchange(other.arena_, nullptr))
    , cache_(std::move(other.cache_))
    , key_(other.key_)
{
}

scoped_transient_key& scoped_transient_key::operator=(scoped_transient_key&& other) noexcept
{
    if (this != &other) {
        reset();
        arena_ = std::exchange(other.arena_, nullptr);
        cache_ = std::move(other.cache_);
        key_ = other.key_;
    }
    return *this;
}

scoped_transient_key::~scoped_transient_key()
{
    reset();
}

void scoped_transient_key::rebind(std::shared_ptr<array_cache> cache)
{
    if (cache == cache_) {
        return;
    }
    erase_entry();
    cache_ = std::move(cache);
}

void scoped_transient_key::erase_entry() noexcept
{
    if (cache_ == nullptr) {
        return;
    }
    try {
        cache_->erase(key_);
    } catch (const std::exception& e) {
        log_warning(log_channel::cache, "Failed to erase {} from cache: {}", key_to_string(key_), e.what());
    } catch (...) {
        log_warning(log_channel::cache, "Failed to erase {} from cache: unknown error", key_to_string(key_));
    }
}

void scoped_transient_key::reset() noexcept
{
    if (arena_ == nullptr) {
        return;
    }
    erase_entry();
    arena_->release(key_);
    arena_ = nullptr;
    cache_.reset();
}

} // namespace ragged
