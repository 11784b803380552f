// components/edge-gateway/include/edge_gateway/revocation_store.hpp
#pragma once

#include "edge_gateway/types.hpp"
#include "shared_cache/connection_pool.hpp"
#include "shared_cache/local_cache.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace edge_gateway {

/**
 * @class IRevocationStore
 * @brief Set of bearer tokens revoked before their expiry (logout, force-revoke)
 */
class IRevocationStore {
public:
    virtual ~IRevocationStore() = default;

    /**
     * @brief Look a token up
     *
     * @param token Raw compact token
     * @param expiry Token expiry; positive hits may be cached until then
     * @return true if revoked; DEPENDENCY_FAILURE when the store is unreachable
     */
    virtual Result<bool> isRevoked(const std::string& token,
                                   std::chrono::system_clock::time_point expiry) = 0;

    /**
     * @brief Add a token; the entry lives until the token expires
     */
    virtual VoidResult revoke(const std::string& token,
                              std::chrono::system_clock::time_point expiry) = 0;

    virtual bool isHealthy() const = 0;
};

/**
 * @brief Process-local revocation set for single-instance deployments and tests
 */
class LocalRevocationStore : public IRevocationStore {
public:
    explicit LocalRevocationStore(size_t maxEntries = 100000);

    Result<bool> isRevoked(const std::string& token,
                           std::chrono::system_clock::time_point expiry) override;
    VoidResult revoke(const std::string& token,
                      std::chrono::system_clock::time_point expiry) override;
    bool isHealthy() const override { return true; }

private:
    shared_cache::LocalCache entries_;
};

/**
 * @class RedisRevocationStore
 * @brief Revocation set shared by all gateway instances through Redis
 *
 * Entries are stored as "<prefix><token>" with a TTL equal to the token's
 * remaining lifetime. Positive answers are mirrored in a LocalCache until
 * the token expires, so a revoked token stops costing a round trip.
 */
class RedisRevocationStore : public IRevocationStore {
public:
    struct Config {
        std::string keyPrefix = "blacklist:token:";
        std::chrono::milliseconds checkoutTimeout{200};
        size_t mirrorSize = 10000;
    };

    RedisRevocationStore(std::shared_ptr<shared_cache::ConnectionPool> pool, const Config& config);

    Result<bool> isRevoked(const std::string& token,
                           std::chrono::system_clock::time_point expiry) override;
    VoidResult revoke(const std::string& token,
                      std::chrono::system_clock::time_point expiry) override;
    bool isHealthy() const override;

    std::string keyFor(const std::string& token) const { return config_.keyPrefix + token; }

private:
    std::shared_ptr<shared_cache::ConnectionPool> pool_;
    Config config_;
    shared_cache::LocalCache mirror_;
};

} // namespace edge_gateway
