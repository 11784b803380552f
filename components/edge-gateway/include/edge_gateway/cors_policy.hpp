// components/edge-gateway/include/edge_gateway/cors_policy.hpp
#pragma once

#include "edge_gateway/route_table.hpp"
#include "edge_gateway/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace edge_gateway {

/**
 * @brief Cross-origin settings for browser clients
 */
struct CorsConfig {
    bool enabled = true;
    // Exact origins, or with a "*." host wildcard such as https://*.example.com
    std::vector<std::string> allowedOrigins = {
        "http://localhost:3000", "http://localhost:3001",
        "https://*.travelowkey.com", "https://travelowkey.com"
    };
    std::vector<std::string> allowedMethods = {"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"};
    std::vector<std::string> allowedHeaders = {
        "authorization", "content-type", "x-requested-with", "x-user-id",
        "x-correlation-id", "cache-control"
    };
    std::vector<std::string> exposedHeaders = {"x-total-count", "x-correlation-id"};
    bool allowCredentials = true;
    std::chrono::seconds maxAge{3600};
};

/**
 * @class CorsPolicy
 * @brief Answers preflights and decorates responses for allowed origins
 */
class CorsPolicy {
public:
    explicit CorsPolicy(CorsConfig config);

    bool isOriginAllowed(const std::string& origin) const;

    /**
     * @brief OPTIONS carrying Origin and Access-Control-Request-Method
     */
    bool isPreflight(const GatewayRequest& request) const;

    /**
     * @brief Answer a preflight without entering the pipeline
     *
     * 204 when the origin, method and headers are allowed and the requested
     * method resolves a route; 404 when no route matches, 403 otherwise.
     */
    GatewayResponse preflight(const GatewayRequest& request, const RouteTable& routes,
                              std::chrono::system_clock::time_point now) const;

    /**
     * @brief Add Access-Control-* headers for an allowed Origin
     */
    void decorate(const GatewayRequest& request, GatewayResponse& response) const;

    const CorsConfig& config() const { return config_; }

private:
    static bool originMatches(const std::string& pattern, const std::string& origin);
    bool isHeaderAllowed(const std::string& header) const;

    CorsConfig config_;
};

} // namespace edge_gateway
