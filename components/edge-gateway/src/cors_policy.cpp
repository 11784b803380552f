// components/edge-gateway/src/cors_policy.cpp
#include "edge_gateway/cors_policy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace edge_gateway {

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (const auto& value : values) {
        if (!out.empty()) {
            out += ", ";
        }
        out += value;
    }
    return out;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           iequals(value.substr(value.size() - suffix.size()), suffix);
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && iequals(value.substr(0, prefix.size()), prefix);
}

} // anonymous namespace

CorsPolicy::CorsPolicy(CorsConfig config)
    : config_(std::move(config)) {
}

bool CorsPolicy::originMatches(const std::string& pattern, const std::string& origin) {
    if (pattern == "*") {
        return true;
    }

    auto star = pattern.find("*.");
    if (star == std::string::npos) {
        return iequals(pattern, origin);
    }

    const std::string prefix = pattern.substr(0, star);      // https://
    const std::string suffix = pattern.substr(star + 1);     // .example.com
    if (origin.size() <= prefix.size() + suffix.size() ||
        !startsWith(origin, prefix) || !endsWith(origin, suffix)) {
        return false;
    }

    // Subdomain labels only
    const std::string label = origin.substr(prefix.size(), origin.size() - prefix.size() - suffix.size());
    return label.find_first_of("/:@?#") == std::string::npos && label.front() != '.';
}

bool CorsPolicy::isOriginAllowed(const std::string& origin) const {
    if (origin.empty()) {
        return false;
    }
    return std::any_of(config_.allowedOrigins.begin(), config_.allowedOrigins.end(),
                       [&origin](const std::string& pattern) { return originMatches(pattern, origin); });
}

bool CorsPolicy::isHeaderAllowed(const std::string& header) const {
    return std::any_of(config_.allowedHeaders.begin(), config_.allowedHeaders.end(),
                       [&header](const std::string& allowed) {
                           return allowed == "*" || iequals(allowed, header);
                       });
}

bool CorsPolicy::isPreflight(const GatewayRequest& request) const {
    return config_.enabled &&
           iequals(request.method, "OPTIONS") &&
           findHeader(request.headers, "Origin") != nullptr &&
           findHeader(request.headers, "Access-Control-Request-Method") != nullptr;
}

GatewayResponse CorsPolicy::preflight(const GatewayRequest& request, const RouteTable& routes,
                                      std::chrono::system_clock::time_point now) const {
    const std::string origin = *findHeader(request.headers, "Origin");
    const std::string method = trim(*findHeader(request.headers, "Access-Control-Request-Method"));

    if (!isOriginAllowed(origin)) {
        spdlog::debug("Rejected preflight from origin '{}'", origin);
        return makeErrorResponse(ErrorCode::FORBIDDEN, "Origin not allowed", now);
    }

    bool methodAllowed = std::any_of(config_.allowedMethods.begin(), config_.allowedMethods.end(),
                                     [&method](const std::string& m) { return iequals(m, method); });
    if (!methodAllowed) {
        return makeErrorResponse(ErrorCode::FORBIDDEN, "Method not allowed: " + method, now);
    }

    std::vector<std::string> requestedHeaders;
    if (const std::string* value = findHeader(request.headers, "Access-Control-Request-Headers")) {
        requestedHeaders = splitList(*value);
    }
    for (const auto& header : requestedHeaders) {
        if (!isHeaderAllowed(header)) {
            return makeErrorResponse(ErrorCode::FORBIDDEN, "Header not allowed: " + header, now);
        }
    }

    if (!routes.resolve(method, request.path)) {
        return makeErrorResponse(ErrorCode::ROUTE_NOT_FOUND,
                                 "No route for " + method + " " + request.path, now);
    }

    GatewayResponse response;
    response.status = 204;
    response.headers.emplace_back("Access-Control-Allow-Origin", origin);
    if (config_.allowCredentials) {
        response.headers.emplace_back("Access-Control-Allow-Credentials", "true");
    }
    response.headers.emplace_back("Access-Control-Allow-Methods", join(config_.allowedMethods));
    if (!requestedHeaders.empty()) {
        response.headers.emplace_back("Access-Control-Allow-Headers", join(requestedHeaders));
    }
    response.headers.emplace_back("Access-Control-Max-Age", std::to_string(config_.maxAge.count()));
    response.headers.emplace_back("Vary", "Origin");
    return response;
}

void CorsPolicy::decorate(const GatewayRequest& request, GatewayResponse& response) const {
    if (!config_.enabled) {
        return;
    }
    const std::string* origin = findHeader(request.headers, "Origin");
    if (!origin || !isOriginAllowed(*origin)) {
        return;
    }

    setHeader(response.headers, "Access-Control-Allow-Origin", *origin);
    if (config_.allowCredentials) {
        setHeader(response.headers, "Access-Control-Allow-Credentials", "true");
    }
    if (!config_.exposedHeaders.empty()) {
        setHeader(response.headers, "Access-Control-Expose-Headers", join(config_.exposedHeaders));
    }
    setHeader(response.headers, "Vary", "Origin");
}

} // namespace edge_gateway
