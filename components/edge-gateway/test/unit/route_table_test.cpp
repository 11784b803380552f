// components/edge-gateway/test/unit/route_table_test.cpp
#include "edge_gateway/route_table.hpp"
#include <gtest/gtest.h>

using namespace edge_gateway;

namespace {

RouteEntry makeRoute(const std::string& id, const std::string& pattern,
                     const std::string& method = "*",
                     const std::string& target = "http://backend:8080") {
    RouteEntry entry;
    entry.id = id;
    entry.pathPattern = pattern;
    entry.method = method;
    entry.targetBaseUrl = target;
    return entry;
}

std::shared_ptr<const RouteTable> buildOrFail(std::vector<RouteEntry> entries) {
    auto result = RouteTable::build(std::move(entries));
    EXPECT_TRUE(result.success) << "Route table should build: " << result.errorMessage;
    return result.value;
}

} // anonymous namespace

TEST(RouteTableTest, ExactPatternBeatsParameterAndWildcard) {
    auto table = buildOrFail({
        makeRoute("flights-any", "/api/v1/flights/**"),
        makeRoute("flight-by-id", "/api/v1/flights/{id}"),
        makeRoute("flight-search", "/api/v1/flights/search"),
    });
    ASSERT_TRUE(table);

    const RouteEntry* route = table->resolve("GET", "/api/v1/flights/search");
    ASSERT_NE(nullptr, route);
    EXPECT_EQ("flight-search", route->id);

    route = table->resolve("GET", "/api/v1/flights/VN123");
    ASSERT_NE(nullptr, route);
    EXPECT_EQ("flight-by-id", route->id);

    route = table->resolve("GET", "/api/v1/flights/VN123/seats");
    ASSERT_NE(nullptr, route);
    EXPECT_EQ("flights-any", route->id);
}

TEST(RouteTableTest, TrailingWildcardMatchesPrefixItself) {
    auto table = buildOrFail({makeRoute("hotels", "/api/v1/hotels/**")});
    ASSERT_TRUE(table);

    EXPECT_NE(nullptr, table->resolve("GET", "/api/v1/hotels"));
    EXPECT_NE(nullptr, table->resolve("GET", "/api/v1/hotels/"));
    EXPECT_NE(nullptr, table->resolve("GET", "/api/v1/hotels/1/rooms/2"));
    EXPECT_EQ(nullptr, table->resolve("GET", "/api/v1/hotel"));
    EXPECT_EQ(nullptr, table->resolve("GET", "/api/v1"));
}

TEST(RouteTableTest, ExactMethodBeatsAnyMethod) {
    auto table = buildOrFail({
        makeRoute("bookings", "/api/v1/bookings/**"),
        makeRoute("bookings-create", "/api/v1/bookings/**", "post"),
    });
    ASSERT_TRUE(table);

    const RouteEntry* route = table->resolve("POST", "/api/v1/bookings");
    ASSERT_NE(nullptr, route);
    EXPECT_EQ("bookings-create", route->id);
    EXPECT_EQ("POST", route->method) << "Methods should be normalized to upper case";

    route = table->resolve("get", "/api/v1/bookings/7");
    ASSERT_NE(nullptr, route);
    EXPECT_EQ("bookings", route->id);
}

TEST(RouteTableTest, MethodMismatchResolvesToNothing) {
    auto table = buildOrFail({makeRoute("login", "/api/v1/auth/login", "POST")});
    ASSERT_TRUE(table);

    EXPECT_NE(nullptr, table->resolve("POST", "/api/v1/auth/login"));
    EXPECT_EQ(nullptr, table->resolve("GET", "/api/v1/auth/login"));
}

TEST(RouteTableTest, QueryStringIsIgnored) {
    auto table = buildOrFail({makeRoute("cars", "/api/v1/cars/{id}")});
    ASSERT_TRUE(table);

    const RouteEntry* route = table->resolve("GET", "/api/v1/cars/12?include=extras");
    ASSERT_NE(nullptr, route);
    EXPECT_EQ("cars", route->id);
}

TEST(RouteTableTest, FewerParametersWin) {
    auto table = buildOrFail({
        makeRoute("two-params", "/api/v1/{a}/{b}"),
        makeRoute("one-param", "/api/v1/reviews/{id}"),
    });
    ASSERT_TRUE(table);

    EXPECT_EQ("one-param", table->resolve("GET", "/api/v1/reviews/3")->id);
    EXPECT_EQ("two-params", table->resolve("GET", "/api/v1/users/3")->id);
}

TEST(RouteTableTest, ConfigurationOrderBreaksTies) {
    auto table = buildOrFail({
        makeRoute("first", "/api/{x}/items"),
        makeRoute("second", "/api/items/{x}"),
    });
    ASSERT_TRUE(table);

    EXPECT_EQ("first", table->resolve("GET", "/api/items/items")->id);

    auto entries = table->entries();
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("first", entries[0]->id);
}

TEST(RouteTableTest, BuildFillsDefaults) {
    auto table = buildOrFail({makeRoute("payments", "/api/v1/payments/**", "",
                                        "http://payment-service:3007/internal/")});
    ASSERT_TRUE(table);

    const RouteEntry* route = table->resolve("DELETE", "/api/v1/payments/1");
    ASSERT_NE(nullptr, route);
    EXPECT_EQ("*", route->method);
    EXPECT_EQ("payments", route->breakerName);
    EXPECT_EQ("payment-service", route->target.host);
    EXPECT_EQ(3007, route->target.port);
    EXPECT_EQ("/internal", route->target.basePath);
}

TEST(RouteTableTest, RejectsDuplicatePatternForSameMethod) {
    auto result = RouteTable::build({
        makeRoute("a", "/api/v1/users/{id}", "GET"),
        makeRoute("b", "/api/v1/users/{userId}", "get"),
    });
    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorCode::INVALID_CONFIGURATION, result.errorCode);
}

TEST(RouteTableTest, SamePatternDifferentMethodIsAllowed) {
    auto result = RouteTable::build({
        makeRoute("read", "/api/v1/users/{id}", "GET"),
        makeRoute("write", "/api/v1/users/{id}", "PUT"),
    });
    EXPECT_TRUE(result.success) << result.errorMessage;
}

TEST(RouteTableTest, RejectsInvalidEntries) {
    EXPECT_FALSE(RouteTable::build({makeRoute("", "/x")}).success) << "Empty id";
    EXPECT_FALSE(RouteTable::build({makeRoute("a", "/x"), makeRoute("a", "/y")}).success)
        << "Duplicate id";
    EXPECT_FALSE(RouteTable::build({makeRoute("a", "x/y")}).success) << "Relative pattern";
    EXPECT_FALSE(RouteTable::build({makeRoute("a", "/x/**/y")}).success) << "Inner **";
    EXPECT_FALSE(RouteTable::build({makeRoute("a", "/x/{id")}).success) << "Unclosed brace";
    EXPECT_FALSE(RouteTable::build({makeRoute("a", "/x/{}")}).success) << "Empty parameter";
    EXPECT_FALSE(RouteTable::build({makeRoute("a", "/x/pre*")}).success) << "Partial wildcard";
    EXPECT_FALSE(RouteTable::build({makeRoute("a", "/x", "*", "https://secure")}).success)
        << "TLS target";

    RouteEntry badRate = makeRoute("a", "/x");
    badRate.rateLimit.capacity = 0.0;
    EXPECT_FALSE(RouteTable::build({badRate}).success) << "Zero capacity";

    RouteEntry badBreaker = makeRoute("a", "/x");
    badBreaker.breaker.minimumNumberOfCalls = badBreaker.breaker.slidingWindowSize + 1;
    EXPECT_FALSE(RouteTable::build({badBreaker}).success) << "minCalls above window";

    RouteEntry badTimeout = makeRoute("a", "/x");
    badTimeout.timeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(RouteTable::build({badTimeout}).success) << "Zero timeout";

    RouteEntry badFallback = makeRoute("a", "/x");
    badFallback.fallback.status = 42;
    EXPECT_FALSE(RouteTable::build({badFallback}).success) << "Fallback status";
}

TEST(ParseBackendUrlTest, ParsesHostPortAndPath) {
    auto result = parseBackendUrl("http://flight-service:3003");
    ASSERT_TRUE(result.success);
    EXPECT_EQ("flight-service", result.value.host);
    EXPECT_EQ(3003, result.value.port);
    EXPECT_EQ("", result.value.basePath);

    result = parseBackendUrl("http://localhost/base/");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(80, result.value.port);
    EXPECT_EQ("/base", result.value.basePath);
}

TEST(ParseBackendUrlTest, RejectsBadUrls) {
    EXPECT_FALSE(parseBackendUrl("").success);
    EXPECT_FALSE(parseBackendUrl("lb://auth-service").success);
    EXPECT_FALSE(parseBackendUrl("http://:8080").success);
    EXPECT_FALSE(parseBackendUrl("http://host:abc").success);
    EXPECT_FALSE(parseBackendUrl("http://host:70000").success);
}

TEST(SplitPathTest, DropsEmptySegments) {
    auto segments = splitPath("//api/v1//users/");
    ASSERT_EQ(3u, segments.size());
    EXPECT_EQ("api", segments[0]);
    EXPECT_EQ("users", segments[2]);
    EXPECT_TRUE(splitPath("/").empty());
}
