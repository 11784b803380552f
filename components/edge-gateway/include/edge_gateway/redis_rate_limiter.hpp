// components/edge-gateway/include/edge_gateway/redis_rate_limiter.hpp
#pragma once

#include "edge_gateway/rate_limiter.hpp"
#include "shared_cache/connection_pool.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace edge_gateway {

/**
 * @brief Shortest text that reads back as the same double in Lua
 */
std::string formatScriptNumber(double value);

/**
 * @class RedisRateLimiter
 * @brief Token bucket shared by all gateway instances through Redis
 *
 * Each acquire runs one Lua script, so refill and take are atomic per key
 * on the server. The script reads the Redis server clock, which keeps
 * instances with skewed clocks consistent. Buckets are hashes
 * {tokens, ts} expiring after the idle TTL.
 *
 * When Redis cannot answer, the decision is taken by the local limiter and
 * a warning is logged; limits then hold per instance only.
 */
class RedisRateLimiter : public IRateLimiter {
public:
    struct Config {
        std::chrono::seconds idleTtl{600};
        std::chrono::milliseconds checkoutTimeout{200};
    };

    RedisRateLimiter(std::shared_ptr<shared_cache::ConnectionPool> pool,
                     std::shared_ptr<IRateLimiter> localFallback,
                     const Config& config);

    RateLimitDecision tryAcquire(const std::string& key, const RateLimitPolicy& policy) override;

    uint64_t getFallbackCount() const { return fallbackCount_.load(); }

    static const std::string& script();

private:
    /**
     * @brief Run the script on Redis
     * @return false if Redis could not produce a decision
     */
    bool acquireRemote(const std::string& key, const RateLimitPolicy& policy,
                       RateLimitDecision& decision);

    bool parseReply(const shared_cache::RedisReply& reply, const RateLimitPolicy& policy,
                    RateLimitDecision& decision) const;

    std::shared_ptr<shared_cache::ConnectionPool> pool_;
    std::shared_ptr<IRateLimiter> localFallback_;
    Config config_;

    std::mutex shaMutex_;
    std::string scriptSha_;

    std::atomic<uint64_t> fallbackCount_{0};
    std::atomic<bool> degraded_{false};
};

} // namespace edge_gateway
