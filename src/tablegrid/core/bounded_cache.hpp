#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace tablegrid {

enum class EvictionPolicy
{
    OldestInserted, ///< FIFO: lookups do not refresh an entry
    LeastRecentlyUsed,
};

/**
 * @brief Fixed-capacity key/value cache.
 *
 * Entries live in a list ordered from next-to-evict to most recently
 * inserted (or used, under LeastRecentlyUsed). Inserting into a full cache
 * evicts the front entry. A capacity of zero disables caching entirely.
 *
 * Not thread-safe; owners serialize access.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class BoundedCache
{
public:
    explicit BoundedCache(size_t capacity, EvictionPolicy policy = EvictionPolicy::OldestInserted)
        : capacity_(capacity)
        , policy_(policy)
    { }

    Value const* find(Key const& key)
    {
        auto it = index_.find(key);
        if (it == index_.end())
            return nullptr;

        if (policy_ == EvictionPolicy::LeastRecentlyUsed)
            entries_.splice(entries_.end(), entries_, it->second);

        return &it->second->second;
    }

    /// Insert or replace. Returns the evicted key, if any.
    std::optional<Key> insert(Key const& key, Value value)
    {
        if (capacity_ == 0)
            return std::nullopt;

        if (auto it = index_.find(key); it != index_.end())
        {
            it->second->second = std::move(value);
            if (policy_ == EvictionPolicy::LeastRecentlyUsed)
                entries_.splice(entries_.end(), entries_, it->second);
            return std::nullopt;
        }

        std::optional<Key> evicted;
        if (entries_.size() >= capacity_)
        {
            evicted = entries_.front().first;
            index_.erase(entries_.front().first);
            entries_.pop_front();
        }

        entries_.emplace_back(key, std::move(value));
        index_.emplace(key, std::prev(entries_.end()));
        return evicted;
    }

    bool contains(Key const& key) const { return index_.contains(key); }

    void clear()
    {
        index_.clear();
        entries_.clear();
    }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    EvictionPolicy policy() const { return policy_; }

private:
    using Entry = std::pair<Key, Value>;

    size_t capacity_;
    EvictionPolicy policy_;
    std::list<Entry> entries_;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
};

} // namespace tablegrid
