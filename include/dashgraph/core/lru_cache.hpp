#pragma once

#include <dashgraph/core/result.hpp>

#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dashgraph {

// ---------------------------------------------------------------------------
// LruCache — fixed-capacity map that drops the least recently used entry
// when an insert would exceed the capacity.
//
// Get() and Put() count as uses; Peek() and Contains() do not.
// Not synchronized: owners guard it with their own mutex.
// ---------------------------------------------------------------------------
template <typename K, typename V, typename Hash = std::hash<K>>
class LruCache {
public:
    static Result<LruCache, Error> Create(std::size_t capacity) {
        if (capacity == 0) {
            return Result<LruCache, Error>::Err(Error{
                "LruCache::Create", "", "capacity must be positive", std::nullopt,
                ErrorCategory::Configuration});
        }
        return Result<LruCache, Error>::Ok(LruCache(capacity));
    }

    LruCache(LruCache&&) = default;
    LruCache& operator=(LruCache&&) = default;
    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    /// Value for `key`, marking it most recently used.
    std::optional<V> Get(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }

    /// Value for `key` without touching recency.
    [[nodiscard]] std::optional<V> Peek(const K& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second->second;
    }

    [[nodiscard]] bool Contains(const K& key) const {
        return index_.count(key) > 0;
    }

    /// Insert or replace `key`. Returns the evicted key, if any.
    std::optional<K> Put(const K& key, V value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.begin(), order_, it->second);
            return std::nullopt;
        }

        order_.emplace_front(key, std::move(value));
        index_.emplace(key, order_.begin());

        if (order_.size() <= capacity_) {
            return std::nullopt;
        }
        K evicted = std::move(order_.back().first);
        index_.erase(evicted);
        order_.pop_back();
        return evicted;
    }

    bool Remove(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void Clear() {
        index_.clear();
        order_.clear();
    }

    /// Keys from most to least recently used.
    [[nodiscard]] std::vector<K> Keys() const {
        std::vector<K> keys;
        keys.reserve(order_.size());
        for (const auto& entry : order_) {
            keys.push_back(entry.first);
        }
        return keys;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return order_.size(); }
    [[nodiscard]] std::size_t Capacity() const noexcept { return capacity_; }

private:
    using Entry = std::pair<K, V>;
    using Order = std::list<Entry>;

    explicit LruCache(std::size_t capacity) : capacity_(capacity) {}

    std::size_t capacity_;
    Order order_;
    std::unordered_map<K, typename Order::iterator, Hash> index_;
};

} // namespace dashgraph
