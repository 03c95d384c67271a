#pragma once
#include <unordered_map>
#include <list>
#include <string>
#include <optional>
#include <stdexcept>

namespace rastile {

struct CacheStats {
    long hits = 0;
    long misses = 0;
    long evictions = 0;
    int size = 0;
    int max_size = 0;
    double hit_rate = 0.0; // percent, 0 when no lookups happened
};

/* Bounded key -> value store with least-recently-used eviction and
   hit/miss/eviction accounting. Single owner, not thread-safe. */
template<typename V>
class LruCache {
public:
    static constexpr int DEFAULT_MAX_SIZE = 500;

    explicit LruCache(int max_size = DEFAULT_MAX_SIZE) : m_max_size(max_size) {
        if (max_size < 1) throw std::invalid_argument("LruCache max_size must be >= 1");
    }

    /* Lookup. A hit promotes the entry to most-recently-used. */
    std::optional<V> get(const std::string& key) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            ++m_misses;
            return std::nullopt;
        }
        promote(it);
        ++m_hits;
        return it->second.value;
    }

    /* Insert or update. Updating promotes without counting an eviction. */
    void set(const std::string& key, V value) {
        auto it = m_map.find(key);
        if (it != m_map.end()) {
            it->second.value = std::move(value);
            promote(it);
            return;
        }

        while (static_cast<int>(m_map.size()) >= m_max_size) {
            evict_lru();
        }

        m_lru.push_front(key);
        m_map.emplace(key, Entry{std::move(value), m_lru.begin()});
    }

    bool has(const std::string& key) const {
        return m_map.find(key) != m_map.end();
    }

    /* Remove one entry. No effect on statistics. */
    bool remove(const std::string& key) {
        auto it = m_map.find(key);
        if (it == m_map.end()) return false;
        m_lru.erase(it->second.lru_it);
        m_map.erase(it);
        return true;
    }

    /* Empties storage; statistics are kept until reset_stats(). */
    void clear() {
        m_map.clear();
        m_lru.clear();
    }

    int size() const { return static_cast<int>(m_map.size()); }
    int max_size() const { return m_max_size; }

    CacheStats stats() const {
        CacheStats s;
        s.hits = m_hits;
        s.misses = m_misses;
        s.evictions = m_evictions;
        s.size = size();
        s.max_size = m_max_size;
        long total = m_hits + m_misses;
        s.hit_rate = total > 0 ? static_cast<double>(m_hits) / total * 100.0 : 0.0;
        return s;
    }

    void reset_stats() {
        m_hits = 0;
        m_misses = 0;
        m_evictions = 0;
    }

private:
    int m_max_size;

    /* LRU list: front = most recently used, back = least recently used */
    using LRUList = std::list<std::string>;
    LRUList m_lru;

    struct Entry {
        V value;
        typename LRUList::iterator lru_it;
    };

    std::unordered_map<std::string, Entry> m_map;

    long m_hits = 0;
    long m_misses = 0;
    long m_evictions = 0;

    void promote(typename std::unordered_map<std::string, Entry>::iterator it) {
        m_lru.splice(m_lru.begin(), m_lru, it->second.lru_it);
        it->second.lru_it = m_lru.begin();
    }

    void evict_lru() {
        if (m_lru.empty()) return;
        m_map.erase(m_lru.back());
        m_lru.pop_back();
        ++m_evictions;
    }
};

} // namespace rastile
