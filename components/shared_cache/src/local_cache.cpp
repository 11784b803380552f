// components/shared_cache/src/local_cache.cpp
#include "shared_cache/local_cache.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace shared_cache {

LocalCache::LocalCache(size_t maxSize, std::chrono::milliseconds ttl)
    : maxSize_(maxSize), ttl_(ttl),
      cleanupInterval_(std::chrono::milliseconds{60000}),
      nextCleanup_(std::chrono::system_clock::now() + cleanupInterval_) {

    if (maxSize_ == 0) {
        throw std::invalid_argument("Cache max size must be greater than 0");
    }

    spdlog::debug("LocalCache created with max size: {}, TTL: {}ms",
                  maxSize_, ttl_.count());
}

bool LocalCache::contains(const std::string& key) {
    std::lock_guard<std::mutex> lock(cacheMutex_);

    auto it = cacheMap_.find(key);

    if (it == cacheMap_.end()) {
        misses_++;
        return false;
    }

    if (std::chrono::system_clock::now() > it->second->expiryTime) {
        cacheList_.erase(it->second);
        cacheMap_.erase(it);
        expiredRemovals_++;
        misses_++;
        return false;
    }

    moveToFront(it->second);
    hits_++;

    return true;
}

bool LocalCache::insert(const std::string& key) {
    return insert(key, std::chrono::system_clock::now() + ttl_);
}

bool LocalCache::insert(const std::string& key,
                        std::chrono::system_clock::time_point expiryTime) {
    std::lock_guard<std::mutex> lock(cacheMutex_);

    checkAndRunCleanup();

    auto existingIt = cacheMap_.find(key);
    if (existingIt != cacheMap_.end()) {
        existingIt->second->expiryTime = expiryTime;
        moveToFront(existingIt->second);
        return true;
    }

    if (cacheList_.size() >= maxSize_) {
        if (!evictLRU()) {
            spdlog::warn("Failed to evict LRU entry from cache");
            return false;
        }
    }

    cacheList_.push_front(CacheEntry{key, expiryTime});
    cacheMap_[key] = cacheList_.begin();
    insertions_++;

    return true;
}

bool LocalCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(cacheMutex_);

    auto it = cacheMap_.find(key);

    if (it == cacheMap_.end()) {
        return false;
    }

    cacheList_.erase(it->second);
    cacheMap_.erase(it);

    return true;
}

void LocalCache::clear() {
    std::lock_guard<std::mutex> lock(cacheMutex_);

    cacheList_.clear();
    cacheMap_.clear();
}

size_t LocalCache::cleanupExpired() {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return removeExpiredEntries();
}

size_t LocalCache::size() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return cacheList_.size();
}

LocalCache::CacheStats LocalCache::getStats() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);

    CacheStats stats;
    stats.currentSize = cacheList_.size();
    stats.maxSize = maxSize_;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.insertions = insertions_.load();
    stats.evictions = evictions_.load();
    stats.expiredRemovals = expiredRemovals_.load();

    const uint64_t lookups = stats.hits + stats.misses;
    stats.hitRate = lookups == 0 ? 0.0 : static_cast<double>(stats.hits) / lookups;

    return stats;
}

void LocalCache::setCleanupInterval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(cacheMutex_);

    cleanupInterval_ = interval;
    if (interval.count() > 0) {
        nextCleanup_ = std::chrono::system_clock::now() + interval;
    } else {
        nextCleanup_ = std::chrono::system_clock::time_point::max();
    }
}

void LocalCache::moveToFront(CacheIterator it) {
    cacheList_.splice(cacheList_.begin(), cacheList_, it);
}

bool LocalCache::evictLRU() {
    if (cacheList_.empty()) {
        return false;
    }

    auto lruIt = std::prev(cacheList_.end());
    cacheMap_.erase(lruIt->key);
    cacheList_.erase(lruIt);
    evictions_++;

    return true;
}

size_t LocalCache::removeExpiredEntries() {
    const auto now = std::chrono::system_clock::now();
    size_t removedCount = 0;

    auto it = cacheList_.begin();
    while (it != cacheList_.end()) {
        if (now > it->expiryTime) {
            cacheMap_.erase(it->key);
            it = cacheList_.erase(it);
            removedCount++;
            expiredRemovals_++;
        } else {
            ++it;
        }
    }

    if (removedCount > 0) {
        spdlog::debug("Removed {} expired entries from cache", removedCount);
    }

    return removedCount;
}

void LocalCache::checkAndRunCleanup() {
    const auto now = std::chrono::system_clock::now();

    if (cleanupInterval_.count() > 0 && now >= nextCleanup_) {
        removeExpiredEntries();
        nextCleanup_ = now + cleanupInterval_;
    }
}

} // namespace shared_cache
