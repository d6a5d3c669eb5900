#include "cache.hpp"
#include "ragged.hpp"

#include <algorithm>
#include <vector>

namespace ragged {

std::string key_to_string(const cache_key& key)
{
    if (const auto* s = std::get_if<std::string>(&key)) {
        return *s;
    }
    return fmt::format("<transient {}>", std::get<transient_key>(key).id);
}

std::size_t cache_key_hash::operator()(const cache_key& key) const noexcept
{
    if (const auto* s = std::get_if<std::string>(&key)) {
        return std::hash<std::string>()(*s);
    }
    return std::hash<uint64_t>()(std::get<transient_key>(key).id) ^ 0x9e3779b97f4a7c15ULL;
}

memory_cache::memory_cache(std::size_t capacity)
    : capacity_(capacity)
{
}

std::optional<array> memory_cache::find(const cache_key& key) const
{
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void memory_cache::insert(const cache_key& key, array value)
{
    std::vector<cache_key> evicted;
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = entries_.insert_or_assign(key, std::move(value));
        if (!inserted) {
            return;
        }
        order_.push_back(key);
        while (capacity_ != 0 && entries_.size() > capacity_) {
            evicted.push_back(std::move(order_.front()));
            order_.pop_front();
            entries_.erase(evicted.back());
        }
    }
    for (const auto& victim : evicted) {
        log_debug(log_channel::cache, "Evicted {} from memory cache", key_to_string(victim));
    }
}

bool memory_cache::erase(const cache_key& key)
{
    std::lock_guard lock(mutex_);
    if (entries_.erase(key) == 0) {
        return false;
    }
    order_.erase(std::find(order_.begin(), order_.end(), key));
    return true;
}

std::size_t memory_cache::size() const
{
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void memory_cache::clear()
{
    std::lock_guard lock(mutex_);
    entries_.clear();
    order_.clear();
}

std::shared_ptr<memory_cache> make_memory_cache(const config& c)
{
    return std::make_shared<memory_cache>(c.cache_capacity);
}

} // namespace ragged
