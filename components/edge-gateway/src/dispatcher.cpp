// components/edge-gateway/src/dispatcher.cpp
#include "edge_gateway/dispatcher.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cmath>
#include <stdexcept>

namespace edge_gateway {

using metrics_sink::RequestOutcome;

namespace {

RequestOutcome toRequestOutcome(ForwardOutcome outcome) {
    switch (outcome) {
        case ForwardOutcome::SUCCESS:            return RequestOutcome::SUCCESS;
        case ForwardOutcome::CLIENT_ERROR:       return RequestOutcome::CLIENT_ERROR;
        case ForwardOutcome::SERVER_ERROR:       return RequestOutcome::SERVER_ERROR;
        case ForwardOutcome::TIMEOUT:            return RequestOutcome::TIMEOUT;
        case ForwardOutcome::CONNECTION_FAILURE: return RequestOutcome::CONNECTION_FAILURE;
        case ForwardOutcome::CANCELLED:          return RequestOutcome::CANCELLED;
        default:                                 return RequestOutcome::INTERNAL_ERROR;
    }
}

} // anonymous namespace

std::string generateCorrelationId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

// PendingRequest implementation
void PendingRequest::cancel() {
    std::shared_ptr<IForwardCall> call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        call = call_;
    }
    if (call) {
        call->cancel();
    }
}

bool PendingRequest::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void PendingRequest::attach(std::shared_ptr<IForwardCall> call) {
    bool cancelNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        call_ = call;
        cancelNow = cancelled_;
    }
    // Disconnect raced the start of the forward
    if (cancelNow && call) {
        call->cancel();
    }
}

// Dispatcher implementation
const std::vector<std::string>& Dispatcher::forwardedHeaderAllowlist() {
    static const std::vector<std::string> allowlist = {
        "Content-Type", "Accept", "Accept-Language", "Accept-Encoding", "User-Agent",
        "X-Requested-With", "Cache-Control", "If-None-Match", "If-Modified-Since",
        "X-Correlation-Id"
    };
    return allowlist;
}

Dispatcher::Dispatcher(const Config& config,
                       std::shared_ptr<const RouteTable> routes,
                       std::shared_ptr<AuthGate> authGate,
                       std::shared_ptr<IRateLimiter> rateLimiter,
                       std::shared_ptr<BreakerRegistry> breakers,
                       std::shared_ptr<IBackendClient> backend,
                       std::shared_ptr<metrics_sink::IMetricsSink> metrics,
                       std::shared_ptr<IClock> clock)
    : config_(config)
    , routes_(std::move(routes))
    , authGate_(std::move(authGate))
    , rateLimiter_(std::move(rateLimiter))
    , breakers_(std::move(breakers))
    , backend_(std::move(backend))
    , metrics_(std::move(metrics))
    , clock_(std::move(clock)) {
    if (!routes_ || !authGate_ || !rateLimiter_ || !breakers_ || !backend_ || !clock_) {
        throw std::invalid_argument("Dispatcher requires every collaborator");
    }
    if (!metrics_) {
        metrics_ = std::make_shared<metrics_sink::NullMetricsSink>();
    }

    for (const RouteEntry* route : routes_->entries()) {
        routeBreakers_[route] = breakers_->getOrCreate(route->breakerName, route->breaker);
    }

    auto sink = metrics_;
    breakers_->setTransitionListener(
        [sink](const std::string& name, CircuitState from, CircuitState to) {
            sink->recordBreakerTransition(name, circuitStateToString(from), circuitStateToString(to));
        });

    stages_ = {
        [this](RequestContext& context) { return matchRoute(context); },
        [this](RequestContext& context) { return authenticate(context); },
        [this](RequestContext& context) { return rateLimit(context); },
        [this](RequestContext& context) { return admitBreaker(context); }
    };
}

std::shared_ptr<PendingRequest> Dispatcher::handle(GatewayRequest request, ResponseCallback callback) {
    auto context = std::make_shared<RequestContext>();
    context->request = std::move(request);
    context->startTime = clock_->now();
    context->pending = std::make_shared<PendingRequest>();

    const std::string* correlationId = findHeader(context->request.headers, "X-Correlation-Id");
    context->correlationId = (correlationId && !correlationId->empty())
                                 ? *correlationId : generateCorrelationId();

    auto pending = context->pending;
    std::optional<GatewayResponse> response;
    ForwardRequest forwardRequest;

    try {
        for (const auto& stage : stages_) {
            response = stage(*context);
            if (response) {
                break;
            }
        }
        if (!response) {
            forwardRequest = buildForwardRequest(*context);
        }
    } catch (const std::exception& e) {
        spdlog::error("Pipeline failure for {} {}: {}", context->request.method,
                      context->request.path, e.what());
        if (context->permit.admitted) {
            context->breaker->onResult(context->permit, false);
        }
        context->outcome = RequestOutcome::INTERNAL_ERROR;
        response = makeError(ErrorCode::INTERNAL_ERROR, "Internal gateway error");
    }

    if (response) {
        complete(*context, *response, callback);
        return pending;
    }

    forward(context, std::move(forwardRequest), std::move(callback));
    return pending;
}

std::optional<GatewayResponse> Dispatcher::matchRoute(RequestContext& context) {
    context.route = routes_->resolve(context.request.method, context.request.path);
    if (!context.route) {
        context.outcome = RequestOutcome::NOT_FOUND;
        return makeError(ErrorCode::ROUTE_NOT_FOUND,
                         "No route for " + context.request.method + " " + context.request.path);
    }
    return std::nullopt;
}

std::optional<GatewayResponse> Dispatcher::authenticate(RequestContext& context) {
    const RouteEntry& route = *context.route;
    const std::string token = AuthGate::extractBearer(context.request.headers);

    if (route.auth.kind == AuthRequirement::Kind::NONE) {
        // Only used to key the rate limit by subject
        if (!token.empty()) {
            auto result = authGate_->authenticate(token);
            if (result.ok()) {
                context.identity = std::move(result.identity);
            }
        }
        return std::nullopt;
    }

    auto result = authGate_->authenticate(token);
    if (!result.ok()) {
        if (config_.authFailureConsumesAnonymousBucket) {
            auto decision = rateLimiter_->tryAcquire(
                makeRateLimitKey(route.id, "", context.request.remoteAddress), route.rateLimit);
            if (!decision.allowed) {
                context.outcome = RequestOutcome::RATE_LIMITED;
                return rateLimited(decision);
            }
        }

        spdlog::debug("Authentication failed on route '{}': {}", route.id, result.message);
        context.outcome = RequestOutcome::UNAUTHORIZED;
        return makeError(authErrorToCode(result.error), result.message);
    }

    context.identity = std::move(result.identity);

    if (!AuthGate::authorize(&*context.identity, route.auth)) {
        spdlog::debug("Subject '{}' lacks {} on route '{}'", context.identity->subjectId,
                      authRequirementToString(route.auth), route.id);
        context.outcome = RequestOutcome::FORBIDDEN;
        return makeError(ErrorCode::FORBIDDEN, "Insufficient permissions");
    }

    return std::nullopt;
}

std::optional<GatewayResponse> Dispatcher::rateLimit(RequestContext& context) {
    const RouteEntry& route = *context.route;
    const std::string subject = context.identity ? context.identity->subjectId : "";

    auto decision = rateLimiter_->tryAcquire(
        makeRateLimitKey(route.id, subject, context.request.remoteAddress), route.rateLimit);
    if (!decision.allowed) {
        context.outcome = RequestOutcome::RATE_LIMITED;
        return rateLimited(decision);
    }
    return std::nullopt;
}

std::optional<GatewayResponse> Dispatcher::admitBreaker(RequestContext& context) {
    context.breaker = routeBreakers_.at(context.route);
    context.permit = context.breaker->tryAdmit();
    if (!context.permit.admitted) {
        spdlog::debug("Breaker '{}' rejected {} {}, serving fallback", context.breaker->name(),
                      context.request.method, context.request.path);
        context.outcome = RequestOutcome::SHORT_CIRCUITED;
        return makeFallback(context);
    }
    return std::nullopt;
}

void Dispatcher::forward(const std::shared_ptr<RequestContext>& context, ForwardRequest request,
                         ResponseCallback callback) {
    auto pending = context->pending;
    auto sharedCallback = std::make_shared<ResponseCallback>(std::move(callback));
    auto delivered = std::make_shared<std::atomic<bool>>(false);

    std::shared_ptr<IForwardCall> call;
    try {
        call = backend_->forward(
            std::move(request), context->route->timeout,
            [this, context, sharedCallback, delivered](ForwardResult result) {
                delivered->store(true);
                onForwardComplete(*context, std::move(result), *sharedCallback);
            });
    } catch (const std::exception& e) {
        if (delivered->load()) {
            spdlog::error("Backend client for route '{}' threw after completing: {}",
                          context->route->id, e.what());
            return;
        }
        spdlog::error("Backend call for route '{}' could not be started: {}",
                      context->route->id, e.what());
        // Releases the probe slot when the breaker is half-open
        context->breaker->onResult(context->permit, false);
        context->outcome = RequestOutcome::INTERNAL_ERROR;
        GatewayResponse response = makeError(ErrorCode::INTERNAL_ERROR, "Internal gateway error");
        complete(*context, response, *sharedCallback);
        return;
    }

    pending->attach(std::move(call));
}

void Dispatcher::onForwardComplete(RequestContext& context, ForwardResult result,
                                   ResponseCallback& callback) {
    const RouteEntry& route = *context.route;
    context.breaker->onResult(context.permit, result.succeeded());
    context.outcome = toRequestOutcome(result.outcome);

    GatewayResponse response;
    switch (result.outcome) {
        case ForwardOutcome::SUCCESS:
        case ForwardOutcome::CLIENT_ERROR:
            response = std::move(result.response);
            break;
        case ForwardOutcome::SERVER_ERROR:
            spdlog::warn("Route '{}' backend answered {} for {} {}", route.id, result.statusCode,
                         context.request.method, context.request.path);
            response = std::move(result.response);
            break;
        case ForwardOutcome::TIMEOUT:
            spdlog::warn("Route '{}' backend timed out after {} ms", route.id, route.timeout.count());
            response = makeError(ErrorCode::UPSTREAM_TIMEOUT, "Upstream service did not respond in time");
            break;
        case ForwardOutcome::CONNECTION_FAILURE:
            spdlog::warn("Route '{}' backend unreachable: {}", route.id, result.errorMessage);
            response = makeError(ErrorCode::BAD_GATEWAY, "Upstream service unavailable");
            break;
        case ForwardOutcome::CANCELLED:
            spdlog::info("Route '{}' request cancelled by client", route.id);
            response = makeError(ErrorCode::CLIENT_CLOSED_REQUEST, "Client closed request");
            break;
    }

    complete(context, response, callback);
}

ForwardRequest Dispatcher::buildForwardRequest(const RequestContext& context) const {
    const RouteEntry& route = *context.route;
    const GatewayRequest& inbound = context.request;

    ForwardRequest request;
    request.method = inbound.method;
    request.host = route.target.host;
    request.port = route.target.port;
    request.target = route.target.basePath + inbound.path;
    if (request.target.empty()) {
        request.target = "/";
    }
    if (!inbound.query.empty()) {
        request.target += "?" + inbound.query;
    }
    request.body = inbound.body;

    for (const auto& header : inbound.headers) {
        for (const auto& allowed : forwardedHeaderAllowlist()) {
            if (iequals(header.first, allowed)) {
                request.headers.push_back(header);
                break;
            }
        }
    }

    std::string forwardedFor = inbound.remoteAddress;
    if (const std::string* existing = findHeader(inbound.headers, "X-Forwarded-For")) {
        if (!existing->empty()) {
            forwardedFor = *existing + ", " + inbound.remoteAddress;
        }
    }
    setHeader(request.headers, "X-Forwarded-For", forwardedFor);
    setHeader(request.headers, "X-Forwarded-Proto", config_.forwardedProto);
    setHeader(request.headers, "X-Correlation-Id", context.correlationId);

    if (context.identity) {
        setHeader(request.headers, "X-Internal-Identity", authGate_->mintAssertion(*context.identity));
    }

    return request;
}

GatewayResponse Dispatcher::makeFallback(const RequestContext& context) const {
    const RouteEntry& route = *context.route;
    GatewayResponse response;
    response.status = route.fallback.status;

    if (!route.fallback.body.empty()) {
        response.headers.emplace_back("Content-Type", route.fallback.contentType);
        response.body = route.fallback.body;
        return response;
    }

    auto waitSeconds = static_cast<long long>(
        std::ceil(std::chrono::duration<double>(route.breaker.waitDurationInOpenState).count()));

    nlohmann::json body = {
        {"error", "Service Unavailable"},
        {"message", route.fallback.message.empty()
                        ? route.id + " service is temporarily unavailable"
                        : route.fallback.message},
        {"code", errorCodeToString(ErrorCode::SERVICE_UNAVAILABLE)},
        {"route", route.id},
        {"breaker", route.breakerName},
        {"timestamp", formatIso8601(clock_->wallTime())},
        {"retryAfter", waitSeconds}
    };

    response.headers.emplace_back("Content-Type", "application/json");
    response.body = body.dump();
    return response;
}

GatewayResponse Dispatcher::makeError(ErrorCode code, const std::string& message) const {
    return makeErrorResponse(code, message, clock_->wallTime());
}

GatewayResponse Dispatcher::rateLimited(const RateLimitDecision& decision) const {
    GatewayResponse response = makeError(ErrorCode::RATE_LIMITED, "Too many requests");
    response.headers.emplace_back("Retry-After", std::to_string(decision.retryAfterSeconds()));
    return response;
}

void Dispatcher::complete(RequestContext& context, GatewayResponse& response,
                          ResponseCallback& callback) {
    setHeader(response.headers, "X-Correlation-Id", context.correlationId);

    metrics_sink::RequestEvent event;
    event.routeId = context.route ? context.route->id : "";
    event.outcome = context.outcome;
    event.latency = std::chrono::duration_cast<std::chrono::microseconds>(
        clock_->now() - context.startTime);
    event.statusCode = response.status;
    if (context.breaker) {
        event.breakerName = context.breaker->name();
        event.breakerStateAfter = circuitStateToString(context.breaker->state());
    }
    metrics_->record(event);

    callback(std::move(response));
}

} // namespace edge_gateway
