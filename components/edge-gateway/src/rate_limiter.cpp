// components/edge-gateway/src/rate_limiter.cpp
#include "edge_gateway/rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

namespace edge_gateway {

long RateLimitDecision::retryAfterSeconds() const {
    long seconds = static_cast<long>(std::ceil(retryAfter.count()));
    return std::max(1L, seconds);
}

std::string makeRateLimitKey(const std::string& routeId, const std::string& subjectId,
                             const std::string& remoteAddress) {
    if (!subjectId.empty()) {
        return "rl:" + routeId + ":user:" + subjectId;
    }
    return "rl:" + routeId + ":ip:" + remoteAddress;
}

void TokenBucketRateLimiter::Bucket::refill(std::chrono::steady_clock::time_point now,
                                            const RateLimitPolicy& policy) {
    if (now > lastRefill) {
        double elapsed = std::chrono::duration<double>(now - lastRefill).count();
        tokens = std::min(policy.capacity, tokens + elapsed * policy.refillPerSecond);
        lastRefill = now;
    }
    // Capacity may have shrunk since the bucket was created
    tokens = std::min(tokens, policy.capacity);
}

TokenBucketRateLimiter::TokenBucketRateLimiter(const Config& config, std::shared_ptr<IClock> clock)
    : config_(config)
    , clock_(std::move(clock)) {
    if (config_.shardCount == 0) {
        throw std::invalid_argument("Rate limiter shard count must be greater than 0");
    }
    if (!clock_) {
        throw std::invalid_argument("Rate limiter requires a clock");
    }

    shards_ = std::make_unique<Shard[]>(config_.shardCount);
    auto firstSweep = clock_->now() + config_.sweepInterval;
    for (size_t i = 0; i < config_.shardCount; ++i) {
        shards_[i].nextSweep = firstSweep;
    }
}

RateLimitDecision TokenBucketRateLimiter::tryAcquire(const std::string& key,
                                                     const RateLimitPolicy& policy) {
    Shard& shard = shardFor(key);
    const auto now = clock_->now();

    std::lock_guard<std::mutex> lock(shard.mutex);

    if (now >= shard.nextSweep) {
        sweepShard(shard, now);
        shard.nextSweep = now + config_.sweepInterval;
    }

    auto it = shard.buckets.find(key);
    if (it == shard.buckets.end()) {
        it = shard.buckets.emplace(key, Bucket{policy.capacity, now}).first;
    }

    Bucket& bucket = it->second;
    bucket.refill(now, policy);

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return RateLimitDecision::allow(bucket.tokens);
    }

    return RateLimitDecision::deny(bucket.tokens, policy.refillPerSecond);
}

size_t TokenBucketRateLimiter::bucketCount() const {
    size_t total = 0;
    for (size_t i = 0; i < config_.shardCount; ++i) {
        std::lock_guard<std::mutex> lock(shards_[i].mutex);
        total += shards_[i].buckets.size();
    }
    return total;
}

size_t TokenBucketRateLimiter::evictIdle() {
    const auto now = clock_->now();
    size_t evicted = 0;
    for (size_t i = 0; i < config_.shardCount; ++i) {
        std::lock_guard<std::mutex> lock(shards_[i].mutex);
        evicted += sweepShard(shards_[i], now);
    }
    return evicted;
}

double TokenBucketRateLimiter::peekTokens(const std::string& key,
                                          const RateLimitPolicy& policy) const {
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.buckets.find(key);
    if (it == shard.buckets.end()) {
        return policy.capacity;
    }

    Bucket copy = it->second;
    copy.refill(clock_->now(), policy);
    return copy.tokens;
}

TokenBucketRateLimiter::Shard& TokenBucketRateLimiter::shardFor(const std::string& key) const {
    return shards_[std::hash<std::string>{}(key) % config_.shardCount];
}

size_t TokenBucketRateLimiter::sweepShard(Shard& shard, std::chrono::steady_clock::time_point now) {
    size_t evicted = 0;
    for (auto it = shard.buckets.begin(); it != shard.buckets.end();) {
        if (now - it->second.lastRefill >= config_.idleTtl) {
            it = shard.buckets.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }

    if (evicted > 0) {
        spdlog::debug("Evicted {} idle rate-limit buckets", evicted);
    }
    return evicted;
}

} // namespace edge_gateway
