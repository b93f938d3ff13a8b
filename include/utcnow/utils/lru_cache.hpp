#pragma once

#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <cstddef>
#include <cstdint>

#ifndef UTCNOW_CACHE_CAPACITY
#define UTCNOW_CACHE_CAPACITY 128
#endif

namespace utcnow::utils {

/// Counters reported by LruCache::info()
struct CacheInfo {
    uint64_t hits{0};
    uint64_t misses{0};
    size_t capacity{0};
    size_t size{0};

    friend bool operator==(const CacheInfo&, const CacheInfo&) = default;
};

/**
 * @brief Fixed-capacity, thread-safe least-recently-used map
 *
 * Entries are kept in a list ordered from most to least recently used; the
 * index maps each key to its list node. A lookup that hits moves the entry to
 * the front, an insert beyond capacity evicts the back.
 *
 * All operations take a single internal mutex, so concurrent callers see
 * insert, evict and clear as atomic steps.
 *
 * Example usage:
 * @code
 *   LruCache<std::string, int> cache(2);
 *   cache.put("a", 1);
 *   cache.put("b", 2);
 *   cache.get("a");      // hit, "a" is now most recent
 *   cache.put("c", 3);   // evicts "b"
 * @endcode
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    /**
     * @param capacity Maximum number of entries
     * @throws std::invalid_argument if capacity is zero
     */
    explicit LruCache(size_t capacity = UTCNOW_CACHE_CAPACITY) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("LruCache capacity must be positive");
        }
        index_.reserve(capacity_);
    }

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    /// Look up a key, counting a hit or a miss
    std::optional<Value> get(const Key& key) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        ++hits_;
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    /// Insert or refresh a key, evicting the least recently used entry if full
    void put(const Key& key, Value value) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        if (entries_.size() >= capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
        entries_.emplace_front(key, std::move(value));
        index_.emplace(entries_.front().first, entries_.begin());
    }

    /**
     * Return the cached value for key, or compute, store and return it.
     *
     * `compute` must return something testable as a bool with operator*
     * (std::optional, expected). Failed results are returned but never
     * stored. The mutex is not held while computing.
     */
    template <typename Compute>
    auto get_or_compute(const Key& key, Compute&& compute) -> decltype(compute()) {
        if (auto cached = get(key)) {
            return std::move(*cached);
        }
        auto result = std::forward<Compute>(compute)();
        if (result) {
            put(key, *result);
        }
        return result;
    }

    [[nodiscard]] bool contains(const Key& key) const {
        std::lock_guard lock(mutex_);
        return index_.find(key) != index_.end();
    }

    /// Drop all entries and reset the hit/miss counters
    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
        index_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    [[nodiscard]] CacheInfo info() const {
        std::lock_guard lock(mutex_);
        return CacheInfo{hits_, misses_, capacity_, entries_.size()};
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    using Entry = std::pair<Key, Value>;
    using EntryList = std::list<Entry>;

    size_t capacity_;
    mutable std::mutex mutex_;
    EntryList entries_;
    std::unordered_map<Key, typename EntryList::iterator, Hash> index_;
    uint64_t hits_{0};
    uint64_t misses_{0};
};

} // namespace utcnow::utils
