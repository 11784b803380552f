// components/edge-gateway/src/config_loader.cpp
#include "edge_gateway/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace edge_gateway {

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::vector<std::string> stringList(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw std::invalid_argument("expected an array of strings");
    }
    return json.get<std::vector<std::string>>();
}

} // anonymous namespace

Result<GatewayConfig> ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<GatewayConfig>::error(ErrorCode::INVALID_CONFIGURATION,
                                            "Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

Result<GatewayConfig> ConfigLoader::loadFromString(const std::string& text) {
    nlohmann::json json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Result<GatewayConfig>::error(ErrorCode::INVALID_CONFIGURATION,
                                            "Configuration is not a JSON object");
    }
    return parse(json);
}

AuthRequirement ConfigLoader::parseAuthRequirement(const nlohmann::json& json) {
    if (json.is_string()) {
        const auto value = json.get<std::string>();
        if (value == "none") {
            return AuthRequirement::none();
        }
        if (value == "authenticated") {
            return AuthRequirement::authenticated();
        }
        throw std::invalid_argument("unknown authRequirement '" + value + "'");
    }

    if (json.is_object() && json.contains("roles")) {
        auto roles = stringList(json["roles"]);
        if (roles.empty()) {
            throw std::invalid_argument("authRequirement roles must not be empty");
        }
        return AuthRequirement::anyOf(std::set<std::string>(roles.begin(), roles.end()));
    }

    throw std::invalid_argument("authRequirement must be \"none\", \"authenticated\" or {\"roles\": [...]}");
}

void ConfigLoader::parseBreaker(const nlohmann::json& json, BreakerConfig& breaker, std::string* name) {
    if (name && json.contains("name")) {
        *name = json["name"].get<std::string>();
    }
    if (json.contains("slidingWindowSize")) {
        breaker.slidingWindowSize = json["slidingWindowSize"].get<size_t>();
    }
    if (json.contains("minCalls")) {
        breaker.minimumNumberOfCalls = json["minCalls"].get<size_t>();
    }
    if (json.contains("failureRateThreshold")) {
        breaker.failureRateThreshold = json["failureRateThreshold"].get<double>();
    }
    if (json.contains("waitDurationSeconds")) {
        breaker.waitDurationInOpenState = std::chrono::milliseconds(
            static_cast<int64_t>(json["waitDurationSeconds"].get<double>() * 1000.0));
    }
    if (json.contains("maxHalfOpenProbes")) {
        breaker.maxHalfOpenProbes = json["maxHalfOpenProbes"].get<size_t>();
        if (!json.contains("requiredSuccesses")) {
            breaker.requiredSuccesses = breaker.maxHalfOpenProbes;
        }
    }
    if (json.contains("requiredSuccesses")) {
        breaker.requiredSuccesses = json["requiredSuccesses"].get<size_t>();
    }
}

void ConfigLoader::parseFallback(const nlohmann::json& json, FallbackSpec& fallback) {
    if (json.contains("status")) {
        fallback.status = json["status"].get<int>();
    }
    if (json.contains("body")) {
        const auto& body = json["body"];
        fallback.body = body.is_string() ? body.get<std::string>() : body.dump();
    }
    if (json.contains("message")) {
        fallback.message = json["message"].get<std::string>();
    }
    if (json.contains("contentType")) {
        fallback.contentType = json["contentType"].get<std::string>();
    }
}

RouteEntry ConfigLoader::parseRoute(const nlohmann::json& json, const RouteDefaults& defaults) {
    RouteEntry route;
    route.auth = defaults.auth;
    route.rateLimit = defaults.rateLimit;
    route.breaker = defaults.breaker;
    route.timeout = defaults.timeout;
    route.fallback = defaults.fallback;

    if (json.contains("id")) {
        route.id = json["id"].get<std::string>();
    }
    if (json.contains("pattern")) {
        route.pathPattern = json["pattern"].get<std::string>();
    }
    if (json.contains("method")) {
        route.method = json["method"].get<std::string>();
    }
    if (json.contains("targetBaseUrl")) {
        route.targetBaseUrl = json["targetBaseUrl"].get<std::string>();
    }
    if (json.contains("authRequirement")) {
        route.auth = parseAuthRequirement(json["authRequirement"]);
    }
    if (json.contains("rateLimit")) {
        const auto& rateLimit = json["rateLimit"];
        if (rateLimit.contains("capacity")) {
            route.rateLimit.capacity = rateLimit["capacity"].get<double>();
        }
        if (rateLimit.contains("refillPerSecond")) {
            route.rateLimit.refillPerSecond = rateLimit["refillPerSecond"].get<double>();
        }
    }
    if (json.contains("breaker")) {
        parseBreaker(json["breaker"], route.breaker, &route.breakerName);
    }
    if (json.contains("timeoutMs")) {
        route.timeout = std::chrono::milliseconds(json["timeoutMs"].get<int64_t>());
    }
    if (json.contains("fallback")) {
        parseFallback(json["fallback"], route.fallback);
    }

    return route;
}

Result<GatewayConfig> ConfigLoader::parse(const nlohmann::json& json) {
    GatewayConfig config;

    try {
        if (json.contains("server")) {
            const auto& server = json["server"];
            if (server.contains("address")) {
                config.server.address = server["address"].get<std::string>();
            }
            if (server.contains("port")) {
                config.server.port = server["port"].get<uint16_t>();
            }
            if (server.contains("threads")) {
                config.server.threads = server["threads"].get<size_t>();
            }
            if (server.contains("maxRequestBodyBytes")) {
                config.server.maxRequestBodyBytes = server["maxRequestBodyBytes"].get<uint64_t>();
            }
            if (server.contains("idleTimeoutSeconds")) {
                config.server.idleTimeout = std::chrono::seconds(server["idleTimeoutSeconds"].get<int64_t>());
            }
            if (server.contains("forwardedProto")) {
                config.dispatcher.forwardedProto = server["forwardedProto"].get<std::string>();
            }
        }

        if (json.contains("auth")) {
            const auto& auth = json["auth"];
            if (auth.contains("jwtSecret")) {
                config.auth.jwtSecret = auth["jwtSecret"].get<std::string>();
            }
            if (auth.contains("internalSecret")) {
                config.auth.internalSecret = auth["internalSecret"].get<std::string>();
            }
            if (auth.contains("clockSkewSeconds")) {
                config.auth.clockSkew = std::chrono::seconds(auth["clockSkewSeconds"].get<int64_t>());
            }
            if (auth.contains("assertionTtlSeconds")) {
                config.auth.assertionTtl = std::chrono::seconds(auth["assertionTtlSeconds"].get<int64_t>());
            }
            if (auth.contains("revocationFailClosed")) {
                config.auth.revocationFailClosed = auth["revocationFailClosed"].get<bool>();
            }
            if (auth.contains("revocationStore")) {
                config.revocationStore = auth["revocationStore"].get<std::string>();
            }
            if (auth.contains("authFailureConsumesAnonymousBucket")) {
                config.dispatcher.authFailureConsumesAnonymousBucket =
                    auth["authFailureConsumesAnonymousBucket"].get<bool>();
            }
        }

        if (json.contains("redis")) {
            const auto& redis = json["redis"];
            auto& cache = config.redis.cache;
            if (redis.contains("enabled")) {
                config.redis.enabled = redis["enabled"].get<bool>();
            }
            if (redis.contains("host")) {
                cache.host = redis["host"].get<std::string>();
            }
            if (redis.contains("port")) {
                cache.port = redis["port"].get<int>();
            }
            if (redis.contains("password")) {
                cache.password = redis["password"].get<std::string>();
            }
            if (redis.contains("database")) {
                cache.database = redis["database"].get<int>();
            }
            if (redis.contains("poolSize")) {
                cache.connectionPoolSize = redis["poolSize"].get<int>();
            }
            if (redis.contains("connectionTimeoutMs")) {
                cache.connectionTimeout = std::chrono::milliseconds(redis["connectionTimeoutMs"].get<int64_t>());
            }
            if (redis.contains("socketTimeoutMs")) {
                cache.socketTimeout = std::chrono::milliseconds(redis["socketTimeoutMs"].get<int64_t>());
            }
            if (redis.contains("checkoutTimeoutMs")) {
                cache.checkoutTimeout = std::chrono::milliseconds(redis["checkoutTimeoutMs"].get<int64_t>());
            }
        }

        if (json.contains("rateLimit")) {
            const auto& rateLimit = json["rateLimit"];
            if (rateLimit.contains("store")) {
                config.rateLimit.store = rateLimit["store"].get<std::string>();
            }
            if (rateLimit.contains("shardCount")) {
                config.rateLimit.shardCount = rateLimit["shardCount"].get<size_t>();
            }
            if (rateLimit.contains("idleTtlSeconds")) {
                config.rateLimit.idleTtl = std::chrono::seconds(rateLimit["idleTtlSeconds"].get<int64_t>());
            }
            if (rateLimit.contains("sweepIntervalSeconds")) {
                config.rateLimit.sweepInterval =
                    std::chrono::seconds(rateLimit["sweepIntervalSeconds"].get<int64_t>());
            }
        }

        if (json.contains("cors")) {
            const auto& cors = json["cors"];
            if (cors.contains("enabled")) {
                config.cors.enabled = cors["enabled"].get<bool>();
            }
            if (cors.contains("allowedOrigins")) {
                config.cors.allowedOrigins = stringList(cors["allowedOrigins"]);
            }
            if (cors.contains("allowedMethods")) {
                config.cors.allowedMethods = stringList(cors["allowedMethods"]);
            }
            if (cors.contains("allowedHeaders")) {
                config.cors.allowedHeaders = stringList(cors["allowedHeaders"]);
            }
            if (cors.contains("exposedHeaders")) {
                config.cors.exposedHeaders = stringList(cors["exposedHeaders"]);
            }
            if (cors.contains("allowCredentials")) {
                config.cors.allowCredentials = cors["allowCredentials"].get<bool>();
            }
            if (cors.contains("maxAgeSeconds")) {
                config.cors.maxAge = std::chrono::seconds(cors["maxAgeSeconds"].get<int64_t>());
            }
        }

        if (json.contains("logging")) {
            const auto& logging = json["logging"];
            if (logging.contains("level")) {
                config.logging.level = logging["level"].get<std::string>();
            }
            if (logging.contains("pattern")) {
                config.logging.pattern = logging["pattern"].get<std::string>();
            }
        }

        if (json.contains("metrics")) {
            const auto& metrics = json["metrics"];
            if (metrics.contains("enabled")) {
                config.metrics.enabled = metrics["enabled"].get<bool>();
            }
            if (metrics.contains("asynchronous")) {
                config.metrics.asynchronous = metrics["asynchronous"].get<bool>();
            }
            if (metrics.contains("queueCapacity")) {
                config.metrics.queueCapacity = metrics["queueCapacity"].get<size_t>();
            }
        }

        if (json.contains("defaults")) {
            const auto& defaults = json["defaults"];
            if (defaults.contains("authRequirement")) {
                config.defaults.auth = parseAuthRequirement(defaults["authRequirement"]);
            }
            if (defaults.contains("rateLimit")) {
                const auto& rateLimit = defaults["rateLimit"];
                if (rateLimit.contains("capacity")) {
                    config.defaults.rateLimit.capacity = rateLimit["capacity"].get<double>();
                }
                if (rateLimit.contains("refillPerSecond")) {
                    config.defaults.rateLimit.refillPerSecond = rateLimit["refillPerSecond"].get<double>();
                }
            }
            if (defaults.contains("breaker")) {
                parseBreaker(defaults["breaker"], config.defaults.breaker, nullptr);
            }
            if (defaults.contains("timeoutMs")) {
                config.defaults.timeout = std::chrono::milliseconds(defaults["timeoutMs"].get<int64_t>());
            }
            if (defaults.contains("fallback")) {
                parseFallback(defaults["fallback"], config.defaults.fallback);
            }
        }

        if (json.contains("routes")) {
            const auto& routes = json["routes"];
            if (!routes.is_array()) {
                throw std::invalid_argument("routes must be an array");
            }
            for (const auto& route : routes) {
                config.routes.push_back(parseRoute(route, config.defaults));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<GatewayConfig>::error(ErrorCode::INVALID_CONFIGURATION,
                                            std::string("Invalid configuration value: ") + e.what());
    } catch (const std::exception& e) {
        return Result<GatewayConfig>::error(ErrorCode::INVALID_CONFIGURATION,
                                            std::string("Invalid configuration: ") + e.what());
    }

    if (config.auth.jwtSecret.empty()) {
        config.auth.jwtSecret = envOrEmpty("JWT_SECRET");
    }
    if (config.auth.internalSecret.empty()) {
        config.auth.internalSecret = envOrEmpty("INTERNAL_ASSERTION_SECRET");
    }

    auto valid = validate(config);
    if (!valid) {
        return Result<GatewayConfig>::error(valid.errorCode, valid.errorMessage);
    }

    return Result<GatewayConfig>::ok(std::move(config));
}

VoidResult ConfigLoader::validate(const GatewayConfig& config) {
    if (config.auth.jwtSecret.empty()) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION,
                               "auth.jwtSecret is not set and JWT_SECRET is empty");
    }
    if (config.auth.internalSecret.empty()) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION,
                               "auth.internalSecret is not set and INTERNAL_ASSERTION_SECRET is empty");
    }
    if (config.auth.internalSecret == config.auth.jwtSecret) {
        spdlog::warn("Internal assertion secret equals the client JWT secret");
    }

    if (config.revocationStore != "local" && config.revocationStore != "redis" &&
        config.revocationStore != "none") {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION,
                               "auth.revocationStore must be local, redis or none");
    }
    if (config.rateLimit.store != "local" && config.rateLimit.store != "redis") {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION, "rateLimit.store must be local or redis");
    }
    if ((config.revocationStore == "redis" || config.rateLimit.store == "redis") && !config.redis.enabled) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION,
                               "A Redis-backed store is selected but redis.enabled is false");
    }
    if (config.redis.enabled && !shared_cache::isValid(config.redis.cache)) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION, "Invalid redis settings");
    }
    if (config.rateLimit.shardCount == 0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION, "rateLimit.shardCount must be > 0");
    }
    if (config.routes.empty()) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION, "No routes configured");
    }

    return makeSuccessResult();
}

} // namespace edge_gateway
