// components/edge-gateway/include/edge_gateway/dispatcher.hpp
#pragma once

#include "edge_gateway/auth_gate.hpp"
#include "edge_gateway/backend_client.hpp"
#include "edge_gateway/circuit_breaker.hpp"
#include "edge_gateway/clock.hpp"
#include "edge_gateway/rate_limiter.hpp"
#include "edge_gateway/route_table.hpp"
#include "edge_gateway/types.hpp"
#include "metrics_sink/metrics_sink.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace edge_gateway {

/**
 * @brief Cancellation handle of a request handed to Dispatcher::handle
 *
 * cancel may be called from any thread. Once the backend call is in
 * flight it is aborted and the request completes with CANCELLED.
 */
class PendingRequest {
public:
    void cancel();
    bool isCancelled() const;

private:
    friend class Dispatcher;

    void attach(std::shared_ptr<IForwardCall> call);

    mutable std::mutex mutex_;
    std::shared_ptr<IForwardCall> call_;
    bool cancelled_ = false;
};

/**
 * @brief Per-request state threaded through the pipeline stages
 */
struct RequestContext {
    GatewayRequest request;
    std::chrono::steady_clock::time_point startTime;
    std::string correlationId;

    const RouteEntry* route = nullptr;
    std::optional<Identity> identity;
    std::shared_ptr<CircuitBreaker> breaker;
    BreakerPermit permit;

    metrics_sink::RequestOutcome outcome = metrics_sink::RequestOutcome::SUCCESS;
    std::shared_ptr<PendingRequest> pending;

    void cancel() {
        if (pending) {
            pending->cancel();
        }
    }
};

/**
 * @class Dispatcher
 * @brief The request pipeline: route, authenticate, rate limit, admit, forward
 *
 * Stages run in a fixed order and each may end the request with a
 * response. Requests that pass every stage are forwarded once, without
 * retries; the outcome is reported to the route's breaker and every
 * request, forwarded or not, produces one metrics event.
 *
 * The dispatcher must outlive every request it has accepted.
 */
class Dispatcher {
public:
    struct Config {
        // When true, a failed authentication spends a token from the caller's
        // address bucket and an empty bucket answers 429 instead of 401
        bool authFailureConsumesAnonymousBucket = false;
        std::string forwardedProto = "http";
    };

    using ResponseCallback = std::function<void(GatewayResponse)>;

    // nullopt continues with the next stage
    using Stage = std::function<std::optional<GatewayResponse>(RequestContext&)>;

    /**
     * @brief Wire the pipeline
     *
     * Registers the breaker of every route and routes breaker transitions
     * to the metrics sink.
     */
    Dispatcher(const Config& config,
               std::shared_ptr<const RouteTable> routes,
               std::shared_ptr<AuthGate> authGate,
               std::shared_ptr<IRateLimiter> rateLimiter,
               std::shared_ptr<BreakerRegistry> breakers,
               std::shared_ptr<IBackendClient> backend,
               std::shared_ptr<metrics_sink::IMetricsSink> metrics,
               std::shared_ptr<IClock> clock);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Run one request through the pipeline
     *
     * @param callback Invoked exactly once with the response, possibly
     *                 before handle returns
     * @return Handle used to cancel the request when the client disconnects
     */
    std::shared_ptr<PendingRequest> handle(GatewayRequest request, ResponseCallback callback);

    const RouteTable& routes() const { return *routes_; }
    const AuthGate& authGate() const { return *authGate_; }

    // Request headers copied to the backend
    static const std::vector<std::string>& forwardedHeaderAllowlist();

private:
    std::optional<GatewayResponse> matchRoute(RequestContext& context);
    std::optional<GatewayResponse> authenticate(RequestContext& context);
    std::optional<GatewayResponse> rateLimit(RequestContext& context);
    std::optional<GatewayResponse> admitBreaker(RequestContext& context);

    void forward(const std::shared_ptr<RequestContext>& context, ForwardRequest request,
                 ResponseCallback callback);
    void onForwardComplete(RequestContext& context, ForwardResult result, ResponseCallback& callback);

    ForwardRequest buildForwardRequest(const RequestContext& context) const;
    GatewayResponse makeFallback(const RequestContext& context) const;
    GatewayResponse makeError(ErrorCode code, const std::string& message) const;
    GatewayResponse rateLimited(const RateLimitDecision& decision) const;

    void complete(RequestContext& context, GatewayResponse& response, ResponseCallback& callback);

    Config config_;
    std::shared_ptr<const RouteTable> routes_;
    std::shared_ptr<AuthGate> authGate_;
    std::shared_ptr<IRateLimiter> rateLimiter_;
    std::shared_ptr<BreakerRegistry> breakers_;
    std::shared_ptr<IBackendClient> backend_;
    std::shared_ptr<metrics_sink::IMetricsSink> metrics_;
    std::shared_ptr<IClock> clock_;

    // Filled in the constructor, read-only afterwards
    std::unordered_map<const RouteEntry*, std::shared_ptr<CircuitBreaker>> routeBreakers_;
    std::vector<Stage> stages_;
};

/**
 * @brief Random correlation id for requests that arrive without one
 */
std::string generateCorrelationId();

} // namespace edge_gateway
