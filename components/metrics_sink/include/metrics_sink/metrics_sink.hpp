// components/metrics_sink/include/metrics_sink/metrics_sink.hpp
#pragma once

#include <chrono>
#include <string>

namespace metrics_sink {

/**
 * @brief Final outcome of one inbound request
 */
enum class RequestOutcome {
    SUCCESS,             // Backend answered 1xx-3xx
    CLIENT_ERROR,        // Backend answered 4xx
    SERVER_ERROR,        // Backend answered 5xx
    TIMEOUT,
    CONNECTION_FAILURE,
    CANCELLED,           // Client went away while the backend call was in flight
    NOT_FOUND,           // No route
    UNAUTHORIZED,
    FORBIDDEN,
    RATE_LIMITED,
    SHORT_CIRCUITED,     // Breaker rejected, fallback served
    INTERNAL_ERROR
};

std::string outcomeToString(RequestOutcome outcome);

/**
 * @brief One completed request as seen by the dispatcher
 */
struct RequestEvent {
    std::string routeId;                  // Empty when no route matched
    RequestOutcome outcome = RequestOutcome::SUCCESS;
    std::chrono::microseconds latency{0};
    int statusCode = 0;
    std::string breakerName;              // Empty if no breaker was consulted
    std::string breakerStateAfter;        // CLOSED, OPEN or HALF_OPEN
};

/**
 * @class IMetricsSink
 * @brief Fire-and-forget observability hook for the request pipeline
 *
 * Implementations must not block the caller and must never let an
 * exception escape into the pipeline.
 */
class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;

    /**
     * @brief Record a completed request
     */
    virtual void record(const RequestEvent& event) noexcept = 0;

    /**
     * @brief Record a breaker state transition
     */
    virtual void recordBreakerTransition(const std::string& breakerName,
                                         const std::string& fromState,
                                         const std::string& toState) noexcept = 0;
};

/**
 * @brief Sink that discards everything
 */
class NullMetricsSink : public IMetricsSink {
public:
    void record(const RequestEvent&) noexcept override {}
    void recordBreakerTransition(const std::string&, const std::string&,
                                 const std::string&) noexcept override {}
};

} // namespace metrics_sink
