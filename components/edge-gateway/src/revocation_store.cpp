// components/edge-gateway/src/revocation_store.cpp
#include "edge_gateway/revocation_store.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace edge_gateway {

namespace {

// Default lifetime for local entries whose expiry has already passed
constexpr std::chrono::milliseconds kLocalDefaultTtl{3600000};

} // anonymous namespace

LocalRevocationStore::LocalRevocationStore(size_t maxEntries)
    : entries_(maxEntries, kLocalDefaultTtl) {
}

Result<bool> LocalRevocationStore::isRevoked(const std::string& token,
                                             std::chrono::system_clock::time_point /*expiry*/) {
    return Result<bool>::ok(entries_.contains(token));
}

VoidResult LocalRevocationStore::revoke(const std::string& token,
                                        std::chrono::system_clock::time_point expiry) {
    if (expiry <= std::chrono::system_clock::now()) {
        // Already expired tokens are rejected by the expiry check
        return makeSuccessResult();
    }
    entries_.insert(token, expiry);
    return makeSuccessResult();
}

RedisRevocationStore::RedisRevocationStore(std::shared_ptr<shared_cache::ConnectionPool> pool,
                                           const Config& config)
    : pool_(std::move(pool))
    , config_(config)
    , mirror_(config.mirrorSize, kLocalDefaultTtl) {
    if (!pool_) {
        throw std::invalid_argument("Redis revocation store requires a connection pool");
    }
}

Result<bool> RedisRevocationStore::isRevoked(const std::string& token,
                                             std::chrono::system_clock::time_point expiry) {
    if (mirror_.contains(token)) {
        return Result<bool>::ok(true);
    }

    auto connection = pool_->getConnection(config_.checkoutTimeout);
    if (!connection) {
        return Result<bool>::error(ErrorCode::DEPENDENCY_FAILURE,
                                   "No Redis connection available for revocation check");
    }

    bool revoked = false;
    if (!connection->exists(keyFor(token), revoked)) {
        return Result<bool>::error(ErrorCode::DEPENDENCY_FAILURE,
                                   "Revocation lookup failed: " + connection->getLastError());
    }

    if (revoked && expiry > std::chrono::system_clock::now()) {
        mirror_.insert(token, expiry);
    }
    return Result<bool>::ok(revoked);
}

VoidResult RedisRevocationStore::revoke(const std::string& token,
                                        std::chrono::system_clock::time_point expiry) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        expiry - std::chrono::system_clock::now());
    if (remaining.count() <= 0) {
        return makeSuccessResult();
    }

    auto connection = pool_->getConnection(config_.checkoutTimeout);
    if (!connection) {
        return makeErrorResult(ErrorCode::DEPENDENCY_FAILURE,
                               "No Redis connection available to revoke token");
    }

    if (!connection->setWithExpiry(keyFor(token), "true", remaining)) {
        return makeErrorResult(ErrorCode::DEPENDENCY_FAILURE,
                               "Failed to store revocation: " + connection->getLastError());
    }

    mirror_.insert(token, expiry);
    spdlog::info("Token revoked for {} ms", remaining.count());
    return makeSuccessResult();
}

bool RedisRevocationStore::isHealthy() const {
    return pool_->isHealthy();
}

} // namespace edge_gateway
