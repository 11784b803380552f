// components/shared_cache/include/shared_cache/local_cache.hpp
#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <chrono>
#include <atomic>
#include <string>
#include <cstdint>

namespace shared_cache {

/**
 * @brief Thread-safe LRU set of string keys with per-entry expiry
 *
 * A hash map gives O(1) lookups and a doubly-linked list gives O(1) LRU
 * updates. Expired entries are removed lazily on access and by a periodic
 * sweep piggybacked on mutating calls.
 */
class LocalCache {
public:
    /**
     * @param maxSize Maximum number of entries in cache
     * @param ttl Default time-to-live for entries inserted without an expiry
     */
    LocalCache(size_t maxSize, std::chrono::milliseconds ttl);

    LocalCache(const LocalCache&) = delete;
    LocalCache& operator=(const LocalCache&) = delete;

    /**
     * @brief Check if a key exists in cache (and is not expired)
     */
    bool contains(const std::string& key);

    /**
     * @brief Insert a key with the default TTL
     */
    bool insert(const std::string& key);

    /**
     * @brief Insert a key with a custom expiry time
     *
     * Re-inserting an existing key refreshes its expiry and LRU position.
     */
    bool insert(const std::string& key, std::chrono::system_clock::time_point expiryTime);

    bool remove(const std::string& key);

    void clear();

    /**
     * @brief Remove all expired entries
     * @return Number of entries removed
     */
    size_t cleanupExpired();

    /**
     * @brief Current size including entries that expired but were not swept yet
     */
    size_t size() const;

    size_t maxSize() const { return maxSize_; }

    struct CacheStats {
        size_t currentSize;
        size_t maxSize;
        uint64_t hits;
        uint64_t misses;
        uint64_t insertions;
        uint64_t evictions;
        uint64_t expiredRemovals;
        double hitRate;
    };

    CacheStats getStats() const;

    /**
     * @brief Set automatic cleanup interval
     * @param interval Interval between automatic sweeps (0 to disable)
     */
    void setCleanupInterval(std::chrono::milliseconds interval);

private:
    struct CacheEntry {
        std::string key;
        std::chrono::system_clock::time_point expiryTime;
    };

    using CacheList = std::list<CacheEntry>;
    using CacheIterator = CacheList::iterator;

    const size_t maxSize_;
    const std::chrono::milliseconds ttl_;

    CacheList cacheList_;
    std::unordered_map<std::string, CacheIterator> cacheMap_;

    mutable std::mutex cacheMutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> insertions_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expiredRemovals_{0};

    std::chrono::milliseconds cleanupInterval_;
    std::chrono::system_clock::time_point nextCleanup_;

    // Must be called with cacheMutex_ held
    void moveToFront(CacheIterator it);
    bool evictLRU();
    size_t removeExpiredEntries();
    void checkAndRunCleanup();
};

} // namespace shared_cache
