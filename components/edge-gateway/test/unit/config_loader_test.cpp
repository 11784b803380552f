// components/edge-gateway/test/unit/config_loader_test.cpp
#include "edge_gateway/config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

using namespace edge_gateway;

namespace {

const char* kMinimalConfig = R"({
    "auth": {"jwtSecret": "client-secret", "internalSecret": "internal-secret"},
    "routes": [
        {"id": "flights", "pattern": "/api/v1/flights/**", "targetBaseUrl": "http://flight-service:3003"}
    ]
})";

} // anonymous namespace

// Test fixture
class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("JWT_SECRET");
        unsetenv("INTERNAL_ASSERTION_SECRET");
    }

    void TearDown() override {
        unsetenv("JWT_SECRET");
        unsetenv("INTERNAL_ASSERTION_SECRET");
    }
};

TEST_F(ConfigLoaderTest, MinimalConfigUsesDefaults) {
    auto result = ConfigLoader::loadFromString(kMinimalConfig);
    ASSERT_TRUE(result.success) << result.errorMessage;

    const GatewayConfig& config = result.value;
    EXPECT_EQ(8080, config.server.port);
    EXPECT_EQ("local", config.revocationStore);
    EXPECT_EQ("local", config.rateLimit.store);
    EXPECT_FALSE(config.redis.enabled);
    EXPECT_TRUE(config.auth.revocationFailClosed);

    ASSERT_EQ(1u, config.routes.size());
    const RouteEntry& route = config.routes[0];
    EXPECT_EQ(AuthRequirement::Kind::AUTHENTICATED, route.auth.kind)
        << "Routes require authentication unless configured otherwise";
    EXPECT_EQ(10000, route.timeout.count());
    EXPECT_DOUBLE_EQ(20.0, route.rateLimit.capacity);
    EXPECT_EQ(503, route.fallback.status);
}

TEST_F(ConfigLoaderTest, RoutesInheritAndOverrideDefaults) {
    auto result = ConfigLoader::loadFromString(R"({
        "auth": {"jwtSecret": "a", "internalSecret": "b"},
        "defaults": {
            "authRequirement": "none",
            "rateLimit": {"capacity": 5, "refillPerSecond": 1},
            "breaker": {"slidingWindowSize": 20, "minCalls": 10, "waitDurationSeconds": 15},
            "timeoutMs": 2000
        },
        "routes": [
            {"id": "plain", "pattern": "/plain/**", "targetBaseUrl": "http://plain:1"},
            {
                "id": "admin",
                "pattern": "/api/v1/admin/**",
                "method": "get",
                "targetBaseUrl": "http://admin-service:3010",
                "authRequirement": {"roles": ["ADMIN", "SUPER_ADMIN"]},
                "rateLimit": {"capacity": 50},
                "breaker": {"name": "admin-service", "maxHalfOpenProbes": 2},
                "timeoutMs": 500,
                "fallback": {"status": 200, "body": {"status": "degraded"}, "contentType": "application/json"}
            }
        ]
    })");
    ASSERT_TRUE(result.success) << result.errorMessage;
    ASSERT_EQ(2u, result.value.routes.size());

    const RouteEntry& plain = result.value.routes[0];
    EXPECT_EQ(AuthRequirement::Kind::NONE, plain.auth.kind);
    EXPECT_DOUBLE_EQ(5.0, plain.rateLimit.capacity);
    EXPECT_EQ(20u, plain.breaker.slidingWindowSize);
    EXPECT_EQ(10u, plain.breaker.minimumNumberOfCalls);
    EXPECT_EQ(15000, plain.breaker.waitDurationInOpenState.count());
    EXPECT_EQ(2000, plain.timeout.count());
    EXPECT_EQ("", plain.breakerName);

    const RouteEntry& admin = result.value.routes[1];
    EXPECT_EQ("get", admin.method);
    EXPECT_EQ(AuthRequirement::Kind::ROLES, admin.auth.kind);
    EXPECT_EQ((std::set<std::string>{"ADMIN", "SUPER_ADMIN"}), admin.auth.roles);
    EXPECT_DOUBLE_EQ(50.0, admin.rateLimit.capacity);
    EXPECT_DOUBLE_EQ(1.0, admin.rateLimit.refillPerSecond);
    EXPECT_EQ("admin-service", admin.breakerName);
    EXPECT_EQ(2u, admin.breaker.maxHalfOpenProbes);
    EXPECT_EQ(2u, admin.breaker.requiredSuccesses) << "requiredSuccesses follows maxHalfOpenProbes";
    EXPECT_EQ(20u, admin.breaker.slidingWindowSize);
    EXPECT_EQ(500, admin.timeout.count());
    EXPECT_EQ(200, admin.fallback.status);
    EXPECT_EQ(R"({"status":"degraded"})", admin.fallback.body);
}

TEST_F(ConfigLoaderTest, SecretsFallBackToEnvironment) {
    setenv("JWT_SECRET", "env-client", 1);
    setenv("INTERNAL_ASSERTION_SECRET", "env-internal", 1);

    auto result = ConfigLoader::loadFromString(R"({
        "routes": [{"id": "a", "pattern": "/a", "targetBaseUrl": "http://a:1"}]
    })");
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ("env-client", result.value.auth.jwtSecret);
    EXPECT_EQ("env-internal", result.value.auth.internalSecret);
}

TEST_F(ConfigLoaderTest, FileSecretWinsOverEnvironment) {
    setenv("JWT_SECRET", "env-client", 1);

    auto result = ConfigLoader::loadFromString(kMinimalConfig);
    ASSERT_TRUE(result.success);
    EXPECT_EQ("client-secret", result.value.auth.jwtSecret);
}

TEST_F(ConfigLoaderTest, MissingSecretsAreRejected) {
    auto result = ConfigLoader::loadFromString(R"({
        "routes": [{"id": "a", "pattern": "/a", "targetBaseUrl": "http://a:1"}]
    })");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorCode::INVALID_CONFIGURATION, result.errorCode);
}

TEST_F(ConfigLoaderTest, RedisStoresRequireRedis) {
    auto result = ConfigLoader::loadFromString(R"({
        "auth": {"jwtSecret": "a", "internalSecret": "b", "revocationStore": "redis"},
        "routes": [{"id": "a", "pattern": "/a", "targetBaseUrl": "http://a:1"}]
    })");
    EXPECT_FALSE(result.success);

    result = ConfigLoader::loadFromString(R"({
        "auth": {"jwtSecret": "a", "internalSecret": "b"},
        "redis": {"enabled": true, "host": "redis", "port": 6379},
        "rateLimit": {"store": "redis"},
        "routes": [{"id": "a", "pattern": "/a", "targetBaseUrl": "http://a:1"}]
    })");
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ("redis", result.value.redis.cache.host);
}

TEST_F(ConfigLoaderTest, RejectsMalformedInput) {
    EXPECT_FALSE(ConfigLoader::loadFromString("not json").success);
    EXPECT_FALSE(ConfigLoader::loadFromString("[1, 2]").success);
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({
        "auth": {"jwtSecret": "a", "internalSecret": "b"},
        "routes": {"id": "a"}
    })").success) << "routes must be an array";
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({
        "auth": {"jwtSecret": "a", "internalSecret": "b"},
        "server": {"port": "eighty"},
        "routes": [{"id": "a", "pattern": "/a", "targetBaseUrl": "http://a:1"}]
    })").success) << "Wrong value type";
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({
        "auth": {"jwtSecret": "a", "internalSecret": "b"},
        "routes": [{"id": "a", "pattern": "/a", "targetBaseUrl": "http://a:1", "authRequirement": "admins"}]
    })").success) << "Unknown auth requirement";
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({
        "auth": {"jwtSecret": "a", "internalSecret": "b"},
        "rateLimit": {"store": "memcached"},
        "routes": [{"id": "a", "pattern": "/a", "targetBaseUrl": "http://a:1"}]
    })").success) << "Unknown store";
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({
        "auth": {"jwtSecret": "a", "internalSecret": "b"}
    })").success) << "No routes";
}

TEST_F(ConfigLoaderTest, MissingFileIsReported) {
    auto result = ConfigLoader::loadFromFile("/nonexistent/gateway.json");
    EXPECT_FALSE(result.success);
    EXPECT_NE(std::string::npos, result.errorMessage.find("/nonexistent/gateway.json"));
}

TEST_F(ConfigLoaderTest, ShippedConfigurationBuildsRouteTable) {
    setenv("JWT_SECRET", "shipped-client", 1);
    setenv("INTERNAL_ASSERTION_SECRET", "shipped-internal", 1);

    auto result = ConfigLoader::loadFromFile(std::string(EDGE_GATEWAY_SOURCE_DIR) + "/config/gateway.json");
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(9u, result.value.routes.size());

    auto table = RouteTable::build(result.value.routes);
    ASSERT_TRUE(table.success) << table.errorMessage;

    const RouteEntry* admin = table.value->resolve("GET", "/api/v1/admin/users");
    ASSERT_NE(nullptr, admin);
    EXPECT_EQ(AuthRequirement::Kind::ROLES, admin->auth.kind);

    const RouteEntry* login = table.value->resolve("POST", "/api/v1/auth/login");
    ASSERT_NE(nullptr, login);
    EXPECT_EQ(AuthRequirement::Kind::NONE, login->auth.kind);
    EXPECT_EQ("auth-service", login->breakerName);
}
