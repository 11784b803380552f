// components/edge-gateway/src/route_table.cpp
#include "edge_gateway/route_table.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace edge_gateway {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

Result<std::shared_ptr<const RouteTable>> buildError(const std::string& message) {
    return Result<std::shared_ptr<const RouteTable>>::error(ErrorCode::INVALID_CONFIGURATION, message);
}

} // anonymous namespace

std::string authRequirementToString(const AuthRequirement& requirement) {
    switch (requirement.kind) {
        case AuthRequirement::Kind::NONE:
            return "none";
        case AuthRequirement::Kind::AUTHENTICATED:
            return "authenticated";
        case AuthRequirement::Kind::ROLES: {
            std::string out = "roles(";
            bool first = true;
            for (const auto& role : requirement.roles) {
                if (!first) {
                    out += ",";
                }
                out += role;
                first = false;
            }
            return out + ")";
        }
    }
    return "unknown";
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

Result<BackendTarget> parseBackendUrl(const std::string& url) {
    static const std::string scheme = "http://";

    if (url.empty()) {
        return Result<BackendTarget>::error(ErrorCode::INVALID_CONFIGURATION, "Target URL is empty");
    }
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return Result<BackendTarget>::error(ErrorCode::INVALID_CONFIGURATION,
                                            "Only http:// targets are supported: " + url);
    }

    std::string rest = url.substr(scheme.size());
    std::string authority = rest;
    std::string basePath;

    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        authority = rest.substr(0, slash);
        basePath = rest.substr(slash);
        while (!basePath.empty() && basePath.back() == '/') {
            basePath.pop_back();
        }
    }

    BackendTarget target;
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        target.host = authority.substr(0, colon);
        if (portText.empty() || portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Result<BackendTarget>::error(ErrorCode::INVALID_CONFIGURATION,
                                                "Invalid port in target URL: " + url);
        }
        int port = std::stoi(portText);
        if (port <= 0 || port > 65535) {
            return Result<BackendTarget>::error(ErrorCode::INVALID_CONFIGURATION,
                                                "Port out of range in target URL: " + url);
        }
        target.port = static_cast<uint16_t>(port);
    } else {
        target.host = authority;
    }

    if (target.host.empty()) {
        return Result<BackendTarget>::error(ErrorCode::INVALID_CONFIGURATION,
                                            "Missing host in target URL: " + url);
    }

    target.basePath = basePath;
    return Result<BackendTarget>::ok(std::move(target));
}

Result<RouteTable::CompiledRoute> RouteTable::compile(RouteEntry entry, size_t order) {
    using CompileResult = Result<CompiledRoute>;

    if (entry.pathPattern.empty() || entry.pathPattern.front() != '/') {
        return CompileResult::error(ErrorCode::INVALID_CONFIGURATION,
                                    "Route '" + entry.id + "': pattern must start with '/'");
    }

    CompiledRoute route;
    auto parts = splitPath(entry.pathPattern);

    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string& part = parts[i];

        if (part == "**") {
            if (i + 1 != parts.size()) {
                return CompileResult::error(ErrorCode::INVALID_CONFIGURATION,
                                            "Route '" + entry.id + "': '**' must be the last segment");
            }
            route.trailingWildcard = true;
            continue;
        }

        if (part.find('{') != std::string::npos || part.find('}') != std::string::npos) {
            if (part.front() != '{' || part.back() != '}' || part.size() < 3 ||
                part.find_first_of("{}", 1) != part.size() - 1) {
                return CompileResult::error(ErrorCode::INVALID_CONFIGURATION,
                                            "Route '" + entry.id + "': malformed parameter segment '" +
                                            part + "'");
            }
            route.segments.push_back(Segment{true, part.substr(1, part.size() - 2)});
            ++route.paramCount;
            continue;
        }

        if (part == "*") {
            route.segments.push_back(Segment{true, "*"});
            ++route.paramCount;
            continue;
        }

        if (part.find('*') != std::string::npos) {
            return CompileResult::error(ErrorCode::INVALID_CONFIGURATION,
                                        "Route '" + entry.id + "': unsupported wildcard in '" + part + "'");
        }

        route.segments.push_back(Segment{false, part});
        ++route.literalCount;
    }

    auto target = parseBackendUrl(entry.targetBaseUrl);
    if (!target) {
        return CompileResult::error(target.errorCode, "Route '" + entry.id + "': " + target.errorMessage);
    }
    entry.target = target.value;

    entry.method = entry.method.empty() ? "*" : toUpper(entry.method);
    if (entry.breakerName.empty()) {
        entry.breakerName = entry.id;
    }

    if (entry.rateLimit.capacity < 1.0 || entry.rateLimit.refillPerSecond <= 0.0) {
        return CompileResult::error(ErrorCode::INVALID_CONFIGURATION,
                                    "Route '" + entry.id +
                                    "': rate limit needs capacity >= 1 and refillPerSecond > 0");
    }

    auto breakerValid = validateBreakerConfig(entry.breaker);
    if (!breakerValid) {
        return CompileResult::error(ErrorCode::INVALID_CONFIGURATION,
                                    "Route '" + entry.id + "': " + breakerValid.errorMessage);
    }

    if (entry.timeout.count() <= 0) {
        return CompileResult::error(ErrorCode::INVALID_CONFIGURATION,
                                    "Route '" + entry.id + "': timeout must be positive");
    }

    if (entry.fallback.status < 100 || entry.fallback.status > 599) {
        return CompileResult::error(ErrorCode::INVALID_CONFIGURATION,
                                    "Route '" + entry.id + "': fallback status out of range");
    }

    route.entry = std::move(entry);
    route.order = order;
    return CompileResult::ok(std::move(route));
}

Result<std::shared_ptr<const RouteTable>> RouteTable::build(std::vector<RouteEntry> entries) {
    std::shared_ptr<RouteTable> table(new RouteTable());
    std::set<std::string> ids;
    std::set<std::string> shapes;

    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].id.empty()) {
            return buildError("Route #" + std::to_string(i) + " has no id");
        }
        if (!ids.insert(entries[i].id).second) {
            return buildError("Duplicate route id '" + entries[i].id + "'");
        }

        auto compiled = compile(std::move(entries[i]), i);
        if (!compiled) {
            return buildError(compiled.errorMessage);
        }

        // Parameter names do not distinguish patterns
        std::string shape = compiled.value.entry.method + " ";
        for (const auto& segment : compiled.value.segments) {
            shape += "/" + (segment.param ? std::string("{}") : segment.text);
        }
        if (compiled.value.trailingWildcard) {
            shape += "/**";
        }
        if (!shapes.insert(shape).second) {
            return buildError("Route '" + compiled.value.entry.id + "' duplicates pattern " +
                              compiled.value.entry.pathPattern + " for method " +
                              compiled.value.entry.method);
        }

        table->routes_.push_back(std::move(compiled.value));
    }

    std::sort(table->routes_.begin(), table->routes_.end(),
              [](const CompiledRoute& a, const CompiledRoute& b) {
                  if (a.trailingWildcard != b.trailingWildcard) {
                      return !a.trailingWildcard;
                  }
                  if (a.paramCount != b.paramCount) {
                      return a.paramCount < b.paramCount;
                  }
                  if (a.literalCount != b.literalCount) {
                      return a.literalCount > b.literalCount;
                  }
                  bool aExact = a.entry.method != "*";
                  bool bExact = b.entry.method != "*";
                  if (aExact != bExact) {
                      return aExact;
                  }
                  return a.order < b.order;
              });

    spdlog::info("Route table built with {} routes", table->routes_.size());
    for (const auto& route : table->routes_) {
        spdlog::debug("  {} {} -> {} (auth={}, breaker={})", route.entry.method,
                      route.entry.pathPattern, route.entry.targetBaseUrl,
                      authRequirementToString(route.entry.auth), route.entry.breakerName);
    }

    return Result<std::shared_ptr<const RouteTable>>::ok(std::move(table));
}

bool RouteTable::matches(const CompiledRoute& route, const std::vector<std::string>& segments) {
    if (route.trailingWildcard) {
        if (segments.size() < route.segments.size()) {
            return false;
        }
    } else if (segments.size() != route.segments.size()) {
        return false;
    }

    for (size_t i = 0; i < route.segments.size(); ++i) {
        if (!route.segments[i].param && route.segments[i].text != segments[i]) {
            return false;
        }
    }
    return true;
}

const RouteEntry* RouteTable::resolve(const std::string& method, const std::string& path) const {
    const std::string upperMethod = toUpper(method);
    const auto segments = splitPath(splitTarget(path).first);

    for (const auto& route : routes_) {
        if (route.entry.method != "*" && route.entry.method != upperMethod) {
            continue;
        }
        if (matches(route, segments)) {
            return &route.entry;
        }
    }
    return nullptr;
}

std::vector<const RouteEntry*> RouteTable::entries() const {
    std::vector<const RouteEntry*> result;
    result.reserve(routes_.size());
    for (const auto& route : routes_) {
        result.push_back(&route.entry);
    }
    return result;
}

} // namespace edge_gateway
