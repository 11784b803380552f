// components/edge-gateway/test/unit/dispatcher_test.cpp
#include "edge_gateway/dispatcher.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <tuple>

using namespace edge_gateway;
using metrics_sink::RequestEvent;
using metrics_sink::RequestOutcome;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class MockRateLimiter : public IRateLimiter {
public:
    MOCK_METHOD(RateLimitDecision, tryAcquire,
                (const std::string& key, const RateLimitPolicy& policy), (override));
};

class MockBackendClient : public IBackendClient {
public:
    MOCK_METHOD(std::shared_ptr<IForwardCall>, forward,
                (ForwardRequest request, std::chrono::milliseconds timeout, ForwardCallback callback),
                (override));
};

// Call that answers only when told to, or CANCELLED when cancelled
class HeldCall : public IForwardCall {
public:
    explicit HeldCall(ForwardCallback callback)
        : callback_(std::move(callback)) {}

    void cancel() override {
        ForwardResult result;
        result.outcome = ForwardOutcome::CANCELLED;
        answer(std::move(result));
    }

    void answer(ForwardResult result) {
        if (callback_) {
            auto callback = std::move(callback_);
            callback_ = nullptr;
            callback(std::move(result));
        }
    }

private:
    ForwardCallback callback_;
};

class NoopCall : public IForwardCall {
public:
    void cancel() override {}
};

class RecordingMetricsSink : public metrics_sink::IMetricsSink {
public:
    void record(const RequestEvent& event) noexcept override {
        events.push_back(event);
    }

    void recordBreakerTransition(const std::string& name, const std::string& from,
                                 const std::string& to) noexcept override {
        transitions.emplace_back(name, from, to);
    }

    std::vector<RequestEvent> events;
    std::vector<std::tuple<std::string, std::string, std::string>> transitions;
};

ForwardResult backendAnswer(int status, const std::string& body = "{}") {
    ForwardResult result;
    result.statusCode = status;
    result.outcome = status >= 500 ? ForwardOutcome::SERVER_ERROR
                   : status >= 400 ? ForwardOutcome::CLIENT_ERROR
                                   : ForwardOutcome::SUCCESS;
    result.response.status = status;
    result.response.headers.emplace_back("Content-Type", "application/json");
    result.response.body = body;
    return result;
}

ForwardResult backendFailure(ForwardOutcome outcome) {
    ForwardResult result;
    result.outcome = outcome;
    result.errorMessage = "simulated " + forwardOutcomeToString(outcome);
    return result;
}

long long epochSeconds(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

} // anonymous namespace

// Test fixture
class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<ManualClock>();
        limiter = std::make_shared<NiceMock<MockRateLimiter>>();
        backend = std::make_shared<NiceMock<MockBackendClient>>();
        sink = std::make_shared<RecordingMetricsSink>();
        breakers = std::make_shared<BreakerRegistry>(clock);

        ON_CALL(*limiter, tryAcquire(_, _)).WillByDefault(Return(RateLimitDecision::allow(10.0)));

        authConfig.jwtSecret = "client-secret";
        authConfig.internalSecret = "internal-secret";
        authGate = std::make_shared<AuthGate>(authConfig, std::make_shared<LocalRevocationStore>(), clock);

        RouteEntry auth;
        auth.id = "auth";
        auth.pathPattern = "/api/v1/auth/**";
        auth.targetBaseUrl = "http://auth-service:3001";
        auth.auth = AuthRequirement::none();
        auth.breakerName = "auth-service";

        RouteEntry flights;
        flights.id = "flights";
        flights.pathPattern = "/api/v1/flights/**";
        flights.targetBaseUrl = "http://flight-service:3003";
        flights.auth = AuthRequirement::authenticated();
        flights.breakerName = "flight-service";
        flights.timeout = std::chrono::milliseconds(5000);
        flights.fallback.message = "Flight service is temporarily unavailable";

        RouteEntry admin;
        admin.id = "admin";
        admin.pathPattern = "/api/v1/admin/**";
        admin.targetBaseUrl = "http://admin-service:3010";
        admin.auth = AuthRequirement::anyOf({"ADMIN", "SUPER_ADMIN"});

        RouteEntry payments;
        payments.id = "payments";
        payments.pathPattern = "/api/v1/payments/**";
        payments.targetBaseUrl = "http://payment-service:3007";
        payments.auth = AuthRequirement::authenticated();
        payments.fallback.status = 503;
        payments.fallback.body = R"({"status":"degraded"})";

        RouteEntry hotels;
        hotels.id = "hotels";
        hotels.pathPattern = "/api/v1/hotels/**";
        hotels.targetBaseUrl = "http://hotel-service:3004";
        hotels.auth = AuthRequirement::authenticated();
        hotels.breakerName = "hotel-service";
        hotels.breaker.maxHalfOpenProbes = 1;
        hotels.breaker.requiredSuccesses = 1;

        auto table = RouteTable::build({auth, flights, admin, payments, hotels});
        ASSERT_TRUE(table.success) << table.errorMessage;
        routes = table.value;

        createDispatcher();
    }

    void createDispatcher() {
        dispatcher = std::make_unique<Dispatcher>(dispatcherConfig, routes, authGate, limiter,
                                                  breakers, backend, sink, clock);
    }

    std::string tokenFor(const std::string& subject, const std::vector<std::string>& roles = {"USER"}) {
        nlohmann::json claims = {
            {"sub", subject},
            {"roles", roles},
            {"exp", epochSeconds(clock->wallTime() + std::chrono::minutes(15))}
        };
        return JwtCodec(authConfig.jwtSecret).sign(claims);
    }

    GatewayRequest request(const std::string& method, const std::string& path,
                           const std::string& token = "") {
        GatewayRequest req;
        req.method = method;
        req.path = path;
        req.remoteAddress = "10.0.0.9";
        if (!token.empty()) {
            req.headers.emplace_back("Authorization", "Bearer " + token);
        }
        return req;
    }

    GatewayResponse dispatch(GatewayRequest req) {
        std::optional<GatewayResponse> captured;
        int calls = 0;
        dispatcher->handle(std::move(req), [&](GatewayResponse response) {
            captured = std::move(response);
            ++calls;
        });
        EXPECT_EQ(1, calls) << "Response callback must fire exactly once";
        return captured.value_or(GatewayResponse{});
    }

    void answerWith(const ForwardResult& result) {
        ON_CALL(*backend, forward(_, _, _))
            .WillByDefault(Invoke([this, result](ForwardRequest req, std::chrono::milliseconds timeout,
                                                 ForwardCallback callback) -> std::shared_ptr<IForwardCall> {
                lastForward = std::move(req);
                lastTimeout = timeout;
                ++forwardCount;
                callback(result);
                return std::make_shared<NoopCall>();
            }));
    }

    static nlohmann::json bodyOf(const GatewayResponse& response) {
        return nlohmann::json::parse(response.body);
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<NiceMock<MockRateLimiter>> limiter;
    std::shared_ptr<NiceMock<MockBackendClient>> backend;
    std::shared_ptr<RecordingMetricsSink> sink;
    std::shared_ptr<BreakerRegistry> breakers;
    AuthGate::Config authConfig;
    std::shared_ptr<AuthGate> authGate;
    std::shared_ptr<const RouteTable> routes;
    Dispatcher::Config dispatcherConfig;
    std::unique_ptr<Dispatcher> dispatcher;

    ForwardRequest lastForward;
    std::chrono::milliseconds lastTimeout{0};
    std::atomic<int> forwardCount{0};
};

TEST_F(DispatcherTest, UnknownPathIsNotFound) {
    EXPECT_CALL(*limiter, tryAcquire(_, _)).Times(0);
    EXPECT_CALL(*backend, forward(_, _, _)).Times(0);

    auto response = dispatch(request("GET", "/api/v1/unknown"));
    EXPECT_EQ(404, response.status);
    EXPECT_EQ("ROUTE_NOT_FOUND", bodyOf(response)["code"].get<std::string>());
    EXPECT_NE(nullptr, findHeader(response.headers, "X-Correlation-Id"));

    ASSERT_EQ(1u, sink->events.size());
    EXPECT_EQ(RequestOutcome::NOT_FOUND, sink->events[0].outcome);
    EXPECT_EQ("", sink->events[0].routeId);
    EXPECT_EQ("", sink->events[0].breakerName);
}

TEST_F(DispatcherTest, NotFoundEvenWhenBreakersAreOpen) {
    auto breaker = breakers->find("flight-service");
    ASSERT_TRUE(breaker);
    for (int i = 0; i < 5; ++i) {
        breaker->onResult(breaker->tryAdmit(), false);
    }
    ASSERT_EQ(CircuitState::OPEN, breaker->state());

    EXPECT_EQ(404, dispatch(request("GET", "/nowhere")).status);
}

TEST_F(DispatcherTest, MissingTokenIsUnauthorizedBeforeRateLimit) {
    EXPECT_CALL(*limiter, tryAcquire(_, _)).Times(0);
    EXPECT_CALL(*backend, forward(_, _, _)).Times(0);

    auto response = dispatch(request("GET", "/api/v1/flights/search"));
    EXPECT_EQ(401, response.status);
    EXPECT_EQ("MISSING_TOKEN", bodyOf(response)["code"].get<std::string>());

    ASSERT_EQ(1u, sink->events.size());
    EXPECT_EQ(RequestOutcome::UNAUTHORIZED, sink->events[0].outcome);
    EXPECT_EQ("flights", sink->events[0].routeId);
    EXPECT_EQ("", sink->events[0].breakerName) << "Breaker is not consulted for rejected auth";

    auto stats = breakers->find("flight-service")->getStats();
    EXPECT_EQ(0u, stats.totalCalls);
}

TEST_F(DispatcherTest, ExpiredTokenIsUnauthorized) {
    auto token = tokenFor("user-42");
    clock->advance(std::chrono::minutes(16));

    auto response = dispatch(request("GET", "/api/v1/flights/search", token));
    EXPECT_EQ(401, response.status);
    EXPECT_EQ("TOKEN_EXPIRED", bodyOf(response)["code"].get<std::string>());
}

TEST_F(DispatcherTest, MissingRoleIsForbidden) {
    EXPECT_CALL(*limiter, tryAcquire(_, _)).Times(0);
    EXPECT_CALL(*backend, forward(_, _, _)).Times(0);

    auto response = dispatch(request("GET", "/api/v1/admin/users", tokenFor("user-42")));
    EXPECT_EQ(403, response.status);
    EXPECT_EQ("FORBIDDEN", bodyOf(response)["code"].get<std::string>());
    EXPECT_EQ(RequestOutcome::FORBIDDEN, sink->events.back().outcome);
}

TEST_F(DispatcherTest, AdminRoleIsForwarded) {
    answerWith(backendAnswer(200));
    EXPECT_CALL(*backend, forward(_, _, _)).Times(1);

    auto response = dispatch(request("GET", "/api/v1/admin/users",
                                     tokenFor("root", {"SUPER_ADMIN"})));
    EXPECT_EQ(200, response.status);
    EXPECT_EQ("admin-service", lastForward.host);
    EXPECT_EQ(3010, lastForward.port);
}

TEST_F(DispatcherTest, RateLimitedCarriesRetryAfter) {
    EXPECT_CALL(*limiter, tryAcquire("rl:flights:user:user-42", _))
        .WillOnce(Return(RateLimitDecision::deny(0.0, 1.0)));
    EXPECT_CALL(*backend, forward(_, _, _)).Times(0);

    auto response = dispatch(request("GET", "/api/v1/flights/search", tokenFor("user-42")));
    EXPECT_EQ(429, response.status);
    const std::string* retryAfter = findHeader(response.headers, "Retry-After");
    ASSERT_NE(nullptr, retryAfter);
    EXPECT_EQ("1", *retryAfter);
    EXPECT_EQ(RequestOutcome::RATE_LIMITED, sink->events.back().outcome);
    EXPECT_EQ(0u, breakers->find("flight-service")->getStats().totalCalls);
}

TEST_F(DispatcherTest, PublicRouteForwardsAnonymousRequest) {
    answerWith(backendAnswer(200, R"({"token":"t"})"));
    EXPECT_CALL(*limiter, tryAcquire("rl:auth:ip:10.0.0.9", _)).Times(1);

    auto response = dispatch(request("POST", "/api/v1/auth/login"));
    EXPECT_EQ(200, response.status);
    EXPECT_EQ(R"({"token":"t"})", response.body);
    EXPECT_EQ("/api/v1/auth/login", lastForward.target);
    EXPECT_EQ(nullptr, findHeader(lastForward.headers, "X-Internal-Identity"));
}

TEST_F(DispatcherTest, PublicRouteKeysRateLimitBySubjectWhenTokenIsValid) {
    answerWith(backendAnswer(200));
    EXPECT_CALL(*limiter, tryAcquire("rl:auth:user:user-42", _)).Times(1);

    EXPECT_EQ(200, dispatch(request("POST", "/api/v1/auth/logout", tokenFor("user-42"))).status);
    EXPECT_NE(nullptr, findHeader(lastForward.headers, "X-Internal-Identity"));
}

TEST_F(DispatcherTest, PublicRouteIgnoresBadToken) {
    answerWith(backendAnswer(200));
    EXPECT_CALL(*limiter, tryAcquire("rl:auth:ip:10.0.0.9", _)).Times(1);

    EXPECT_EQ(200, dispatch(request("POST", "/api/v1/auth/refresh", "garbage")).status);
}

TEST_F(DispatcherTest, ForwardedHeadersAreRewritten) {
    answerWith(backendAnswer(200));

    GatewayRequest req = request("POST", "/api/v1/flights/search", tokenFor("user-42"));
    req.query = "from=SGN&to=HAN";
    req.body = R"({"passengers":2})";
    req.headers.emplace_back("Content-Type", "application/json");
    req.headers.emplace_back("Cookie", "session=abc");
    req.headers.emplace_back("X-User-Id", "someone-else");
    req.headers.emplace_back("X-Internal-Identity", "forged");
    req.headers.emplace_back("X-Forwarded-For", "203.0.113.7");
    req.headers.emplace_back("X-Correlation-Id", "corr-123");

    auto response = dispatch(std::move(req));
    EXPECT_EQ(200, response.status);

    EXPECT_EQ("POST", lastForward.method);
    EXPECT_EQ("flight-service", lastForward.host);
    EXPECT_EQ(3003, lastForward.port);
    EXPECT_EQ("/api/v1/flights/search?from=SGN&to=HAN", lastForward.target);
    EXPECT_EQ(R"({"passengers":2})", lastForward.body);
    EXPECT_EQ(5000, lastTimeout.count());

    EXPECT_EQ(nullptr, findHeader(lastForward.headers, "Authorization"));
    EXPECT_EQ(nullptr, findHeader(lastForward.headers, "Cookie"));
    EXPECT_EQ(nullptr, findHeader(lastForward.headers, "X-User-Id"));
    ASSERT_NE(nullptr, findHeader(lastForward.headers, "Content-Type"));
    EXPECT_EQ("203.0.113.7, 10.0.0.9", *findHeader(lastForward.headers, "X-Forwarded-For"));
    EXPECT_EQ("http", *findHeader(lastForward.headers, "X-Forwarded-Proto"));
    EXPECT_EQ("corr-123", *findHeader(lastForward.headers, "X-Correlation-Id"));
    EXPECT_EQ("corr-123", *findHeader(response.headers, "X-Correlation-Id"));

    const std::string* assertion = findHeader(lastForward.headers, "X-Internal-Identity");
    ASSERT_NE(nullptr, assertion);
    EXPECT_NE("forged", *assertion);
    auto claims = JwtCodec(authConfig.internalSecret).verify(*assertion);
    ASSERT_TRUE(claims.success) << claims.errorMessage;
    EXPECT_EQ("user-42", claims.value["sub"].get<std::string>());
}

TEST_F(DispatcherTest, GeneratesCorrelationIdWhenAbsent) {
    answerWith(backendAnswer(200));

    auto response = dispatch(request("GET", "/api/v1/flights/1", tokenFor("user-42")));
    const std::string* correlationId = findHeader(response.headers, "X-Correlation-Id");
    ASSERT_NE(nullptr, correlationId);
    EXPECT_EQ(36u, correlationId->size());
    EXPECT_EQ(*correlationId, *findHeader(lastForward.headers, "X-Correlation-Id"));
}

TEST_F(DispatcherTest, ServerErrorsOpenBreakerThenFallback) {
    answerWith(backendAnswer(500, R"({"error":"boom"})"));
    EXPECT_CALL(*backend, forward(_, _, _)).Times(5);

    const auto token = tokenFor("user-42");
    for (int i = 0; i < 5; ++i) {
        auto response = dispatch(request("GET", "/api/v1/flights/search", token));
        EXPECT_EQ(500, response.status) << "Backend 5xx is passed through";
        EXPECT_EQ(R"({"error":"boom"})", response.body);
    }
    EXPECT_EQ(CircuitState::OPEN, breakers->find("flight-service")->state());

    auto fallback = dispatch(request("GET", "/api/v1/flights/search", token));
    EXPECT_EQ(503, fallback.status);
    auto body = bodyOf(fallback);
    EXPECT_EQ("Service Unavailable", body["error"].get<std::string>());
    EXPECT_EQ("Flight service is temporarily unavailable", body["message"].get<std::string>());
    EXPECT_EQ("SERVICE_UNAVAILABLE", body["code"].get<std::string>());
    EXPECT_EQ("flight-service", body["breaker"].get<std::string>());
    EXPECT_EQ(30, body["retryAfter"].get<int>());

    const RequestEvent& last = sink->events.back();
    EXPECT_EQ(RequestOutcome::SHORT_CIRCUITED, last.outcome);
    EXPECT_EQ("flight-service", last.breakerName);
    EXPECT_EQ("OPEN", last.breakerStateAfter);

    ASSERT_EQ(1u, sink->transitions.size());
    EXPECT_EQ(std::make_tuple(std::string("flight-service"), std::string("CLOSED"), std::string("OPEN")),
              sink->transitions[0]);
}

TEST_F(DispatcherTest, ClientErrorsDoNotOpenBreaker) {
    answerWith(backendAnswer(404, R"({"error":"no such flight"})"));
    EXPECT_CALL(*backend, forward(_, _, _)).Times(10);

    const auto token = tokenFor("user-42");
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(404, dispatch(request("GET", "/api/v1/flights/missing", token)).status);
    }
    EXPECT_EQ(CircuitState::CLOSED, breakers->find("flight-service")->state());
    EXPECT_EQ(RequestOutcome::CLIENT_ERROR, sink->events.back().outcome);
}

TEST_F(DispatcherTest, HalfOpenProbeSuccessClosesBreaker) {
    answerWith(backendFailure(ForwardOutcome::CONNECTION_FAILURE));
    const auto token = tokenFor("user-42");
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(502, dispatch(request("GET", "/api/v1/flights/1", token)).status);
    }
    ASSERT_EQ(CircuitState::OPEN, breakers->find("flight-service")->state());

    clock->advance(std::chrono::seconds(30));
    answerWith(backendAnswer(200));
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(200, dispatch(request("GET", "/api/v1/flights/1", token)).status);
    }
    EXPECT_EQ(CircuitState::CLOSED, breakers->find("flight-service")->state());
}

TEST_F(DispatcherTest, TimeoutIsGatewayTimeout) {
    answerWith(backendFailure(ForwardOutcome::TIMEOUT));

    auto response = dispatch(request("GET", "/api/v1/flights/1", tokenFor("user-42")));
    EXPECT_EQ(504, response.status);
    EXPECT_EQ("UPSTREAM_TIMEOUT", bodyOf(response)["code"].get<std::string>());
    EXPECT_EQ(RequestOutcome::TIMEOUT, sink->events.back().outcome);
    EXPECT_EQ(1u, breakers->find("flight-service")->getStats().windowFailures);
}

TEST_F(DispatcherTest, TimeoutsOpenBreakerThenProbeAfterWait) {
    answerWith(backendFailure(ForwardOutcome::TIMEOUT));
    const auto token = tokenFor("user-42");
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(504, dispatch(request("GET", "/api/v1/flights/1", token)).status);
    }
    auto breaker = breakers->find("flight-service");
    ASSERT_EQ(CircuitState::OPEN, breaker->state());
    EXPECT_EQ(5, forwardCount.load());

    clock->advance(std::chrono::milliseconds(1));
    auto fallback = dispatch(request("GET", "/api/v1/flights/1", token));
    EXPECT_EQ(503, fallback.status);
    EXPECT_EQ(5, forwardCount.load()) << "Open breaker must not reach the backend";

    clock->advance(std::chrono::seconds(30));
    answerWith(backendAnswer(200));
    EXPECT_EQ(200, dispatch(request("GET", "/api/v1/flights/1", token)).status);
    EXPECT_EQ(6, forwardCount.load());
    EXPECT_EQ(CircuitState::HALF_OPEN, breaker->state());
}

TEST_F(DispatcherTest, SingleProbeAdmitsOneOfTwoConcurrentRequests) {
    answerWith(backendFailure(ForwardOutcome::TIMEOUT));
    const auto token = tokenFor("user-42");
    for (int i = 0; i < 5; ++i) {
        dispatch(request("GET", "/api/v1/hotels/search", token));
    }
    auto breaker = breakers->find("hotel-service");
    ASSERT_EQ(CircuitState::OPEN, breaker->state());
    clock->advance(std::chrono::seconds(30));

    std::mutex heldMutex;
    std::vector<std::shared_ptr<HeldCall>> held;
    ON_CALL(*backend, forward(_, _, _))
        .WillByDefault(Invoke([&](ForwardRequest, std::chrono::milliseconds,
                                  ForwardCallback callback) -> std::shared_ptr<IForwardCall> {
            auto call = std::make_shared<HeldCall>(std::move(callback));
            std::lock_guard<std::mutex> lock(heldMutex);
            held.push_back(call);
            return call;
        }));

    std::promise<void> go;
    std::shared_future<void> start = go.get_future().share();
    std::mutex responseMutex;
    std::vector<int> statuses;
    auto send = [&]() {
        start.wait();
        dispatcher->handle(request("GET", "/api/v1/hotels/search", token),
                           [&](GatewayResponse response) {
                               std::lock_guard<std::mutex> lock(responseMutex);
                               statuses.push_back(response.status);
                           });
    };

    std::thread first(send);
    std::thread second(send);
    go.set_value();
    first.join();
    second.join();

    ASSERT_EQ(1u, held.size()) << "Exactly one probe is forwarded";
    {
        std::lock_guard<std::mutex> lock(responseMutex);
        ASSERT_EQ(1u, statuses.size());
        EXPECT_EQ(503, statuses[0]) << "The other request gets the fallback";
    }
    EXPECT_EQ(CircuitState::HALF_OPEN, breaker->state());

    held[0]->answer(backendAnswer(200));
    EXPECT_EQ(2u, statuses.size());
    EXPECT_EQ(200, statuses[1]);
    EXPECT_EQ(CircuitState::CLOSED, breaker->state());
}

TEST_F(DispatcherTest, BackendStartFailureReleasesProbe) {
    answerWith(backendFailure(ForwardOutcome::TIMEOUT));
    const auto token = tokenFor("user-42");
    for (int i = 0; i < 5; ++i) {
        dispatch(request("GET", "/api/v1/hotels/search", token));
    }
    auto breaker = breakers->find("hotel-service");
    ASSERT_EQ(CircuitState::OPEN, breaker->state());
    clock->advance(std::chrono::seconds(30));

    EXPECT_CALL(*backend, forward(_, _, _))
        .WillOnce(Invoke([](ForwardRequest, std::chrono::milliseconds,
                            ForwardCallback) -> std::shared_ptr<IForwardCall> {
            throw std::runtime_error("no sockets left");
        }))
        .WillRepeatedly(Invoke([](ForwardRequest, std::chrono::milliseconds,
                                  ForwardCallback callback) -> std::shared_ptr<IForwardCall> {
            callback(backendAnswer(200));
            return std::make_shared<NoopCall>();
        }));

    auto response = dispatch(request("GET", "/api/v1/hotels/search", token));
    EXPECT_EQ(500, response.status);
    EXPECT_EQ("INTERNAL_ERROR", bodyOf(response)["code"].get<std::string>());
    EXPECT_EQ(RequestOutcome::INTERNAL_ERROR, sink->events.back().outcome);
    EXPECT_EQ(0u, breaker->getStats().halfOpenProbesInFlight);
    EXPECT_EQ(CircuitState::OPEN, breaker->state()) << "Failed probe reopens the breaker";

    clock->advance(std::chrono::seconds(30));
    EXPECT_EQ(200, dispatch(request("GET", "/api/v1/hotels/search", token)).status);
    EXPECT_EQ(CircuitState::CLOSED, breaker->state());
}

TEST_F(DispatcherTest, ConnectionFailureIsBadGateway) {
    answerWith(backendFailure(ForwardOutcome::CONNECTION_FAILURE));

    auto response = dispatch(request("GET", "/api/v1/flights/1", tokenFor("user-42")));
    EXPECT_EQ(502, response.status);
    EXPECT_EQ("BAD_GATEWAY", bodyOf(response)["code"].get<std::string>());
    EXPECT_EQ(RequestOutcome::CONNECTION_FAILURE, sink->events.back().outcome);
}

TEST_F(DispatcherTest, CancelAbortsInFlightCall) {
    ON_CALL(*backend, forward(_, _, _))
        .WillByDefault(Invoke([](ForwardRequest, std::chrono::milliseconds,
                                 ForwardCallback callback) -> std::shared_ptr<IForwardCall> {
            return std::make_shared<HeldCall>(std::move(callback));
        }));

    std::optional<GatewayResponse> captured;
    auto pending = dispatcher->handle(request("GET", "/api/v1/flights/1", tokenFor("user-42")),
                                      [&](GatewayResponse response) { captured = std::move(response); });
    ASSERT_TRUE(pending);
    EXPECT_FALSE(captured) << "Backend has not answered yet";

    pending->cancel();
    ASSERT_TRUE(captured);
    EXPECT_EQ(499, captured->status);
    EXPECT_TRUE(pending->isCancelled());
    EXPECT_EQ(RequestOutcome::CANCELLED, sink->events.back().outcome);
    EXPECT_EQ(1u, breakers->find("flight-service")->getStats().windowFailures);

    pending->cancel();
    EXPECT_EQ(1u, sink->events.size()) << "Second cancel is a no-op";
}

TEST_F(DispatcherTest, ConfiguredFallbackBodyIsServedVerbatim) {
    answerWith(backendFailure(ForwardOutcome::TIMEOUT));
    const auto token = tokenFor("user-42");
    for (int i = 0; i < 5; ++i) {
        dispatch(request("POST", "/api/v1/payments/charge", token));
    }

    auto response = dispatch(request("POST", "/api/v1/payments/charge", token));
    EXPECT_EQ(503, response.status);
    EXPECT_EQ(R"({"status":"degraded"})", response.body);
    EXPECT_EQ("payments", sink->events.back().breakerName) << "Breaker name defaults to the route id";
}

TEST_F(DispatcherTest, AuthFailureCanSpendAnonymousBucket) {
    dispatcherConfig.authFailureConsumesAnonymousBucket = true;
    createDispatcher();

    EXPECT_CALL(*limiter, tryAcquire("rl:flights:ip:10.0.0.9", _))
        .WillOnce(Return(RateLimitDecision::allow(0.0)))
        .WillOnce(Return(RateLimitDecision::deny(0.0, 1.0)));

    EXPECT_EQ(401, dispatch(request("GET", "/api/v1/flights/1")).status);
    EXPECT_EQ(429, dispatch(request("GET", "/api/v1/flights/1")).status);
}

TEST_F(DispatcherTest, StageExceptionIsInternalError) {
    EXPECT_CALL(*limiter, tryAcquire(_, _)).WillOnce(Invoke(
        [](const std::string&, const RateLimitPolicy&) -> RateLimitDecision {
            throw std::runtime_error("limiter exploded");
        }));
    EXPECT_CALL(*backend, forward(_, _, _)).Times(0);

    auto response = dispatch(request("GET", "/api/v1/flights/1", tokenFor("user-42")));
    EXPECT_EQ(500, response.status);
    EXPECT_EQ(RequestOutcome::INTERNAL_ERROR, sink->events.back().outcome);
}

TEST_F(DispatcherTest, RejectsMissingCollaborators) {
    EXPECT_THROW(Dispatcher(dispatcherConfig, nullptr, authGate, limiter, breakers, backend, sink, clock),
                 std::invalid_argument);

    // A missing metrics sink is tolerated
    EXPECT_NO_THROW(Dispatcher(dispatcherConfig, routes, authGate, limiter,
                               std::make_shared<BreakerRegistry>(clock), backend, nullptr, clock));
}

TEST(ForwardOutcomeTest, BreakerFailureClassification) {
    EXPECT_FALSE(isBreakerFailure(ForwardOutcome::SUCCESS));
    EXPECT_FALSE(isBreakerFailure(ForwardOutcome::CLIENT_ERROR));
    EXPECT_TRUE(isBreakerFailure(ForwardOutcome::SERVER_ERROR));
    EXPECT_TRUE(isBreakerFailure(ForwardOutcome::TIMEOUT));
    EXPECT_TRUE(isBreakerFailure(ForwardOutcome::CONNECTION_FAILURE));
    EXPECT_TRUE(isBreakerFailure(ForwardOutcome::CANCELLED));
}
