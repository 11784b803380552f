// components/edge-gateway/src/redis_rate_limiter.cpp
#include "edge_gateway/redis_rate_limiter.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace edge_gateway {

namespace {

// KEYS[1] bucket key
// ARGV[1] capacity, ARGV[2] refill per second, ARGV[3] idle TTL in ms
// Returns {allowed, retryAfterSeconds, tokens}; numbers as strings to keep fractions
const std::string kTokenBucketScript = R"lua(
redis.replicate_commands()
local capacity = tonumber(ARGV[1])
local rate = tonumber(ARGV[2])
local ttl = tonumber(ARGV[3])

local time = redis.call('TIME')
local now = tonumber(time[1]) + tonumber(time[2]) / 1000000

local state = redis.call('HMGET', KEYS[1], 'tokens', 'ts')
local tokens = tonumber(state[1])
local ts = tonumber(state[2])
if tokens == nil or ts == nil then
  tokens = capacity
  ts = now
end

if now > ts then
  tokens = math.min(capacity, tokens + (now - ts) * rate)
  ts = now
end
tokens = math.min(tokens, capacity)

local allowed = 0
local retry = 0
if tokens >= 1 then
  tokens = tokens - 1
  allowed = 1
else
  retry = (1 - tokens) / rate
end

redis.call('HSET', KEYS[1], 'tokens', tostring(tokens), 'ts', tostring(ts))
redis.call('PEXPIRE', KEYS[1], ttl)
return {allowed, tostring(retry), tostring(tokens)}
)lua";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

std::string replyString(const redisReply* element) {
    if (element->type == REDIS_REPLY_STRING || element->type == REDIS_REPLY_STATUS) {
        return std::string(element->str, element->len);
    }
    if (element->type == REDIS_REPLY_INTEGER) {
        return std::to_string(element->integer);
    }
    return "";
}

} // anonymous namespace

std::string formatScriptNumber(double value) {
    return fmt::format("{}", value);
}

const std::string& RedisRateLimiter::script() {
    return kTokenBucketScript;
}

RedisRateLimiter::RedisRateLimiter(std::shared_ptr<shared_cache::ConnectionPool> pool,
                                   std::shared_ptr<IRateLimiter> localFallback,
                                   const Config& config)
    : pool_(std::move(pool))
    , localFallback_(std::move(localFallback))
    , config_(config) {
    if (!pool_ || !localFallback_) {
        throw std::invalid_argument("Redis rate limiter requires a pool and a local fallback");
    }
}

RateLimitDecision RedisRateLimiter::tryAcquire(const std::string& key, const RateLimitPolicy& policy) {
    RateLimitDecision decision;
    if (acquireRemote(key, policy, decision)) {
        if (degraded_.exchange(false)) {
            spdlog::info("Redis rate limiting restored");
        }
        return decision;
    }

    fallbackCount_++;
    if (!degraded_.exchange(true)) {
        spdlog::warn("Redis rate limiting unavailable, enforcing limits per instance");
    }
    return localFallback_->tryAcquire(key, policy);
}

bool RedisRateLimiter::acquireRemote(const std::string& key, const RateLimitPolicy& policy,
                                     RateLimitDecision& decision) {
    auto connection = pool_->getConnection(config_.checkoutTimeout);
    if (!connection) {
        return false;
    }

    const std::string ttlMs = std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.idleTtl).count());
    const std::string capacity = formatScriptNumber(policy.capacity);
    const std::string rate = formatScriptNumber(policy.refillPerSecond);

    std::string sha;
    {
        std::lock_guard<std::mutex> lock(shaMutex_);
        sha = scriptSha_;
    }

    if (sha.empty()) {
        auto loaded = connection->executeArgv({"SCRIPT", "LOAD", kTokenBucketScript});
        if (loaded && !loaded.isError() && loaded->type == REDIS_REPLY_STRING) {
            sha.assign(loaded->str, loaded->len);
            std::lock_guard<std::mutex> lock(shaMutex_);
            scriptSha_ = sha;
        }
    }

    if (!sha.empty()) {
        auto reply = connection->executeArgv({"EVALSHA", sha, "1", key, capacity, rate, ttlMs});
        if (!reply) {
            return false;
        }
        if (!(reply.isError() && startsWith(reply.errorText(), "NOSCRIPT"))) {
            return parseReply(reply, policy, decision);
        }

        // Script cache was flushed; reload on the next call
        std::lock_guard<std::mutex> lock(shaMutex_);
        scriptSha_.clear();
    }

    auto reply = connection->executeArgv({"EVAL", kTokenBucketScript, "1", key, capacity, rate, ttlMs});
    if (!reply) {
        return false;
    }
    return parseReply(reply, policy, decision);
}

bool RedisRateLimiter::parseReply(const shared_cache::RedisReply& reply, const RateLimitPolicy& policy,
                                  RateLimitDecision& decision) const {
    if (reply.isError()) {
        spdlog::warn("Rate limit script failed: {}", reply.errorText());
        return false;
    }
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 3) {
        spdlog::warn("Rate limit script returned an unexpected reply type {}", reply->type);
        return false;
    }

    try {
        bool allowed = std::stoll(replyString(reply->element[0])) == 1;
        double retry = std::stod(replyString(reply->element[1]));
        double tokens = std::stod(replyString(reply->element[2]));

        if (allowed) {
            decision = RateLimitDecision::allow(tokens);
        } else {
            decision = RateLimitDecision::deny(tokens, policy.refillPerSecond);
            decision.retryAfter = std::chrono::duration<double>(retry);
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Unparseable rate limit script reply: {}", e.what());
        return false;
    }
}

} // namespace edge_gateway
