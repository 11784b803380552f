// components/edge-gateway/include/edge_gateway/config.hpp
#pragma once

#include "edge_gateway/auth_gate.hpp"
#include "edge_gateway/cors_policy.hpp"
#include "edge_gateway/dispatcher.hpp"
#include "edge_gateway/route_table.hpp"
#include "edge_gateway/types.hpp"
#include "shared_cache/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace edge_gateway {

struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    size_t threads = 0;                          // 0 means hardware concurrency
    uint64_t maxRequestBodyBytes = 10 * 1024 * 1024;
    std::chrono::seconds idleTimeout{60};        // Keep-alive connections without a request
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%d %H:%M:%S.%e [%l] %v";
};

struct MetricsConfig {
    bool enabled = true;
    bool asynchronous = true;
    size_t queueCapacity = 10000;
};

struct RedisSettings {
    bool enabled = false;
    shared_cache::CacheConfig cache;
};

struct RateLimitSettings {
    std::string store = "local";                 // "local" or "redis"
    size_t shardCount = 16;
    std::chrono::seconds idleTtl{600};
    std::chrono::seconds sweepInterval{60};
};

// Values inherited by routes that do not set them
struct RouteDefaults {
    AuthRequirement auth = AuthRequirement::authenticated();
    RateLimitPolicy rateLimit;
    BreakerConfig breaker;
    std::chrono::milliseconds timeout{10000};
    FallbackSpec fallback;
};

/**
 * @brief Complete gateway configuration
 */
struct GatewayConfig {
    ServerConfig server;
    AuthGate::Config auth;
    std::string revocationStore = "local";       // "local", "redis" or "none"
    RedisSettings redis;
    RateLimitSettings rateLimit;
    CorsConfig cors;
    LoggingConfig logging;
    MetricsConfig metrics;
    Dispatcher::Config dispatcher;
    RouteDefaults defaults;
    std::vector<RouteEntry> routes;
};

/**
 * @class ConfigLoader
 * @brief Reads GatewayConfig from JSON
 *
 * Missing keys keep their defaults; secrets missing from the file are read
 * from JWT_SECRET and INTERNAL_ASSERTION_SECRET.
 */
class ConfigLoader {
public:
    static Result<GatewayConfig> loadFromFile(const std::string& path);
    static Result<GatewayConfig> loadFromString(const std::string& text);
    static Result<GatewayConfig> parse(const nlohmann::json& json);

    /**
     * @brief Cross-field checks that do not need the route table
     */
    static VoidResult validate(const GatewayConfig& config);

private:
    static AuthRequirement parseAuthRequirement(const nlohmann::json& json);
    static void parseBreaker(const nlohmann::json& json, BreakerConfig& breaker, std::string* name);
    static void parseFallback(const nlohmann::json& json, FallbackSpec& fallback);
    static RouteEntry parseRoute(const nlohmann::json& json, const RouteDefaults& defaults);
};

} // namespace edge_gateway
