// components/edge-gateway/include/edge_gateway/rate_limiter.hpp
#pragma once

#include "edge_gateway/clock.hpp"
#include "edge_gateway/types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace edge_gateway {

/**
 * @brief Token bucket parameters of one route
 */
struct RateLimitPolicy {
    double capacity = 20.0;         // Burst size
    double refillPerSecond = 10.0;  // Steady-state rate
};

/**
 * @brief Outcome of a tryAcquire call
 */
struct RateLimitDecision {
    bool allowed = false;
    std::chrono::duration<double> retryAfter{0.0};  // Zero when allowed
    double remainingTokens = 0.0;

    static RateLimitDecision allow(double remaining) {
        return RateLimitDecision{true, std::chrono::duration<double>(0.0), remaining};
    }

    static RateLimitDecision deny(double tokens, double refillPerSecond) {
        return RateLimitDecision{false, std::chrono::duration<double>((1.0 - tokens) / refillPerSecond), tokens};
    }

    /**
     * @brief Whole seconds for the Retry-After header, at least 1
     */
    long retryAfterSeconds() const;
};

/**
 * @class IRateLimiter
 * @brief Interface for per-key rate limiting
 *
 * Implementations must make tryAcquire linearizable per key: of two
 * concurrent callers racing for the last token, exactly one wins.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * @brief Take one token from the bucket identified by key
     *
     * @param key Rate-limit key (route plus subject or client address)
     * @param policy Capacity and refill rate to apply to the bucket
     * @return Allowed, or denied with the time until a token is available
     */
    virtual RateLimitDecision tryAcquire(const std::string& key, const RateLimitPolicy& policy) = 0;
};

/**
 * @class TokenBucketRateLimiter
 * @brief In-process continuous token bucket limiter
 *
 * Buckets live in a fixed number of shards, each guarded by its own mutex,
 * so unrelated keys rarely contend. Buckets idle for longer than the idle
 * TTL are swept out lazily while the shard is locked for an acquire.
 */
class TokenBucketRateLimiter : public IRateLimiter {
public:
    struct Config {
        size_t shardCount = 16;
        std::chrono::seconds idleTtl{600};
        std::chrono::seconds sweepInterval{60};
    };

    TokenBucketRateLimiter(const Config& config, std::shared_ptr<IClock> clock);

    RateLimitDecision tryAcquire(const std::string& key, const RateLimitPolicy& policy) override;

    /**
     * @brief Number of live buckets across all shards
     */
    size_t bucketCount() const;

    /**
     * @brief Drop every bucket idle for longer than the TTL
     * @return Number of buckets evicted
     */
    size_t evictIdle();

    /**
     * @brief Current token count of a bucket without consuming, refilled to now
     * @return capacity for keys without a bucket
     */
    double peekTokens(const std::string& key, const RateLimitPolicy& policy) const;

private:
    struct Bucket {
        double tokens;
        std::chrono::steady_clock::time_point lastRefill;

        void refill(std::chrono::steady_clock::time_point now, const RateLimitPolicy& policy);
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Bucket> buckets;
        std::chrono::steady_clock::time_point nextSweep;
    };

    Shard& shardFor(const std::string& key) const;

    // Must be called with the shard mutex held
    size_t sweepShard(Shard& shard, std::chrono::steady_clock::time_point now);

    Config config_;
    std::shared_ptr<IClock> clock_;
    std::unique_ptr<Shard[]> shards_;
};

/**
 * @brief Rate-limit key: route plus authenticated subject or client address
 */
std::string makeRateLimitKey(const std::string& routeId, const std::string& subjectId,
                             const std::string& remoteAddress);

} // namespace edge_gateway
