// components/edge-gateway/include/edge_gateway/route_table.hpp
#pragma once

#include "edge_gateway/circuit_breaker.hpp"
#include "edge_gateway/rate_limiter.hpp"
#include "edge_gateway/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace edge_gateway {

/**
 * @brief Who may call a route
 */
struct AuthRequirement {
    enum class Kind {
        NONE,           // Anonymous access
        AUTHENTICATED,  // Any verified identity
        ROLES           // Identity holding at least one of the roles
    };

    Kind kind = Kind::NONE;
    std::set<std::string> roles;

    static AuthRequirement none() { return AuthRequirement{}; }
    static AuthRequirement authenticated() { return AuthRequirement{Kind::AUTHENTICATED, {}}; }
    static AuthRequirement anyOf(std::set<std::string> roles) {
        return AuthRequirement{Kind::ROLES, std::move(roles)};
    }
};

std::string authRequirementToString(const AuthRequirement& requirement);

// Response returned while the route's breaker rejects calls
struct FallbackSpec {
    int status = 503;
    std::string body;                              // Empty selects the generated JSON body
    std::string message;                           // Message of the generated body
    std::string contentType = "application/json";
};

// Parsed form of an http:// base URL
struct BackendTarget {
    std::string host;
    uint16_t port = 80;
    std::string basePath;   // No trailing slash; empty for the root
};

/**
 * @brief Parse http://host[:port][/basePath]
 *
 * Only plain http is accepted; the gateway does not originate TLS.
 */
Result<BackendTarget> parseBackendUrl(const std::string& url);

/**
 * @brief One configured route and its policies
 */
struct RouteEntry {
    std::string id;
    std::string pathPattern;        // e.g. /api/v1/flights/{id} or /api/v1/flights/**
    std::string method = "*";       // Upper case, "*" for any
    std::string targetBaseUrl;
    BackendTarget target;           // Filled in by RouteTable::build
    AuthRequirement auth;
    RateLimitPolicy rateLimit;
    std::string breakerName;        // Defaults to id
    BreakerConfig breaker;
    std::chrono::milliseconds timeout{10000};
    FallbackSpec fallback;
};

/**
 * @class RouteTable
 * @brief Immutable (method, path) -> RouteEntry lookup
 *
 * Built once at startup and shared as shared_ptr<const RouteTable>; resolve
 * takes no lock. When several patterns match, the most specific wins:
 *   1. patterns without a trailing /** before those with one
 *   2. fewer {param} segments
 *   3. more literal segments
 *   4. an exact method before "*"
 * Remaining ties keep configuration order.
 */
class RouteTable {
public:
    /**
     * @brief Validate and compile the route entries
     *
     * Fails with INVALID_CONFIGURATION on duplicate pattern+method, duplicate
     * or empty ids, malformed patterns, bad target URLs and invalid policies.
     */
    static Result<std::shared_ptr<const RouteTable>> build(std::vector<RouteEntry> entries);

    /**
     * @brief Find the route for a request
     *
     * @param method Request method, any case
     * @param path Request path; a query string, if present, is ignored
     * @return Matching route or nullptr
     */
    const RouteEntry* resolve(const std::string& method, const std::string& path) const;

    size_t size() const { return routes_.size(); }

    // Routes in match-priority order
    std::vector<const RouteEntry*> entries() const;

private:
    struct Segment {
        bool param;
        std::string text;
    };

    struct CompiledRoute {
        RouteEntry entry;
        std::vector<Segment> segments;
        bool trailingWildcard = false;
        size_t paramCount = 0;
        size_t literalCount = 0;
        size_t order = 0;
    };

    RouteTable() = default;

    static Result<CompiledRoute> compile(RouteEntry entry, size_t order);
    static bool matches(const CompiledRoute& route, const std::vector<std::string>& segments);

    std::vector<CompiledRoute> routes_;
};

/**
 * @brief Split a path into its non-empty segments
 */
std::vector<std::string> splitPath(const std::string& path);

} // namespace edge_gateway
