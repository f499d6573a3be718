/**
 * @file lru_cache.hpp
 * @brief Thread-safe LRU cache with pin-aware eviction
 *
 * Backs the decode-handle, image and audio-buffer caches. An optional
 * eviction filter lets the owner veto eviction of entries that are still in
 * use by an in-flight fetch; such entries are skipped and the cache may run
 * over capacity until trim() is called after the fetch completes.
 */

#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace lumen {

/**
 * @brief LRU cache
 *
 * @tparam Key   Hashable key type
 * @tparam Value Value type (copied out by get())
 *
 * @code
 *   LRUCache<std::string, HandlePtr> handles(8, [](const auto&, auto& h) { h->close(); });
 *   handles.put("media-1", handle);
 *   if (auto h = handles.get("media-1")) { ... }
 * @endcode
 */
template<typename Key, typename Value>
class LRUCache {
public:
    /// Invoked for every entry leaving the cache (eviction, remove, clear)
    using EvictionCallback = std::function<void(const Key&, Value&)>;

    /// Return false to keep an entry that would otherwise be evicted
    using EvictionFilter = std::function<bool(const Key&, const Value&)>;

    explicit LRUCache(size_t maxSize, EvictionCallback onEvict = nullptr)
        : m_maxSize(maxSize)
        , m_onEvict(std::move(onEvict))
    {}

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    void setEvictionFilter(EvictionFilter filter) {
        std::unique_lock lock(m_mutex);
        m_canEvict = std::move(filter);
    }

    /// Look up and mark as most recently used
    [[nodiscard]] std::optional<Value> get(const Key& key) {
        std::unique_lock lock(m_mutex);

        auto it = m_map.find(key);
        if (it == m_map.end()) {
            ++m_misses;
            return std::nullopt;
        }

        ++m_hits;
        m_list.splice(m_list.begin(), m_list, it->second);
        return it->second->second;
    }

    /**
     * @brief Look up, mark as most recently used and pin in one step
     *
     * @p pin runs under the cache lock, so an entry it marks as in use cannot
     * be evicted by a concurrent put() between the lookup and the pin.
     */
    template<typename Pin>
    [[nodiscard]] std::optional<Value> getAndPin(const Key& key, Pin&& pin) {
        std::unique_lock lock(m_mutex);

        auto it = m_map.find(key);
        if (it == m_map.end()) {
            ++m_misses;
            return std::nullopt;
        }

        ++m_hits;
        m_list.splice(m_list.begin(), m_list, it->second);
        pin(it->second->second);
        return it->second->second;
    }

    /// Check presence without touching LRU order
    [[nodiscard]] bool contains(const Key& key) const {
        std::shared_lock lock(m_mutex);
        return m_map.find(key) != m_map.end();
    }

    /**
     * @brief Insert or replace a value
     *
     * Evicts least-recently-used evictable entries until there is room.
     */
    void put(const Key& key, Value value) {
        std::unique_lock lock(m_mutex);

        auto it = m_map.find(key);
        if (it != m_map.end()) {
            it->second->second = std::move(value);
            m_list.splice(m_list.begin(), m_list, it->second);
            return;
        }

        evictDownTo(m_maxSize > 0 ? m_maxSize - 1 : 0);

        m_list.emplace_front(key, std::move(value));
        m_map[key] = m_list.begin();
    }

    bool remove(const Key& key) {
        std::unique_lock lock(m_mutex);

        auto it = m_map.find(key);
        if (it == m_map.end()) {
            return false;
        }

        if (m_onEvict) {
            m_onEvict(it->second->first, it->second->second);
        }
        m_list.erase(it->second);
        m_map.erase(it);
        return true;
    }

    /// Remove an entry only when @p pred accepts its current value
    template<typename Pred>
    bool removeIf(const Key& key, Pred&& pred) {
        std::unique_lock lock(m_mutex);

        auto it = m_map.find(key);
        if (it == m_map.end() || !pred(it->second->second)) {
            return false;
        }

        if (m_onEvict) {
            m_onEvict(it->second->first, it->second->second);
        }
        m_list.erase(it->second);
        m_map.erase(it);
        return true;
    }

    /// Remove every entry, pinned or not
    void clear() {
        std::unique_lock lock(m_mutex);

        if (m_onEvict) {
            for (auto& item : m_list) {
                m_onEvict(item.first, item.second);
            }
        }
        m_list.clear();
        m_map.clear();
    }

    /// Evict entries that became evictable while the cache was over capacity
    void trim() {
        std::unique_lock lock(m_mutex);
        evictDownTo(m_maxSize);
    }

    void resize(size_t newMaxSize) {
        std::unique_lock lock(m_mutex);
        m_maxSize = newMaxSize;
        evictDownTo(m_maxSize);
    }

    /// Visit entries from most to least recently used
    void forEach(const std::function<void(const Key&, const Value&)>& fn) const {
        std::shared_lock lock(m_mutex);
        for (const auto& item : m_list) {
            fn(item.first, item.second);
        }
    }

    [[nodiscard]] std::vector<Key> keys() const {
        std::shared_lock lock(m_mutex);
        std::vector<Key> result;
        result.reserve(m_list.size());
        for (const auto& item : m_list) {
            result.push_back(item.first);
        }
        return result;
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock lock(m_mutex);
        return m_list.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] size_t capacity() const {
        std::shared_lock lock(m_mutex);
        return m_maxSize;
    }

    struct Stats {
        size_t size;
        size_t capacity;
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;

        [[nodiscard]] double hitRate() const {
            uint64_t total = hits + misses;
            return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
        }
    };

    [[nodiscard]] Stats stats() const {
        std::shared_lock lock(m_mutex);
        return {m_list.size(), m_maxSize, m_hits.load(), m_misses.load(), m_evictions.load()};
    }

private:
    using ListType = std::list<std::pair<Key, Value>>;
    using MapType = std::unordered_map<Key, typename ListType::iterator>;

    // Caller holds the unique lock
    void evictDownTo(size_t target) {
        auto it = m_list.end();
        while (m_list.size() > target && it != m_list.begin()) {
            --it;
            if (m_canEvict && !m_canEvict(it->first, it->second)) {
                continue;
            }
            if (m_onEvict) {
                m_onEvict(it->first, it->second);
            }
            m_map.erase(it->first);
            it = m_list.erase(it);
            ++m_evictions;
        }
    }

    size_t m_maxSize;
    ListType m_list;
    MapType m_map;
    EvictionCallback m_onEvict;
    EvictionFilter m_canEvict;

    mutable std::shared_mutex m_mutex;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_misses{0};
    std::atomic<uint64_t> m_evictions{0};
};

/**
 * @brief LRU cache of shared_ptr values
 *
 * A caller holding the returned pointer keeps the value alive after
 * eviction, which is what lets a frame in flight survive a cache trim.
 */
template<typename Key, typename Value>
class SharedLRUCache {
public:
    using ValuePtr = std::shared_ptr<Value>;
    using EvictionCallback = std::function<void(const Key&, ValuePtr&)>;

    explicit SharedLRUCache(size_t maxSize, EvictionCallback onEvict = nullptr)
        : m_cache(maxSize, std::move(onEvict))
    {}

    [[nodiscard]] ValuePtr get(const Key& key) {
        return m_cache.get(key).value_or(nullptr);
    }

    void put(const Key& key, ValuePtr value) { m_cache.put(key, std::move(value)); }

    [[nodiscard]] bool contains(const Key& key) const { return m_cache.contains(key); }

    bool remove(const Key& key) { return m_cache.remove(key); }

    void clear() { m_cache.clear(); }

    [[nodiscard]] size_t size() const { return m_cache.size(); }

    [[nodiscard]] size_t capacity() const { return m_cache.capacity(); }

    [[nodiscard]] typename LRUCache<Key, ValuePtr>::Stats stats() const { return m_cache.stats(); }

private:
    LRUCache<Key, ValuePtr> m_cache;
};

} // namespace lumen
