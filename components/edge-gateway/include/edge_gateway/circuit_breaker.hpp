// components/edge-gateway/include/edge_gateway/circuit_breaker.hpp
#pragma once

#include "edge_gateway/clock.hpp"
#include "edge_gateway/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace edge_gateway {

// Circuit breaker state
enum class CircuitState {
    CLOSED,     // Calls pass, outcomes recorded
    OPEN,       // Calls rejected with the fallback
    HALF_OPEN   // A bounded number of probes pass
};

std::string circuitStateToString(CircuitState state);

/**
 * @brief Circuit breaker configuration
 */
struct BreakerConfig {
    size_t slidingWindowSize = 10;                           // Outcomes kept in the rolling window
    size_t minimumNumberOfCalls = 5;                         // Samples needed before the rate is evaluated
    double failureRateThreshold = 50.0;                      // Percent
    std::chrono::milliseconds waitDurationInOpenState{30000};
    size_t maxHalfOpenProbes = 3;                            // Concurrent probes while HALF_OPEN
    size_t requiredSuccesses = 3;                            // Probe successes needed to close
};

VoidResult validateBreakerConfig(const BreakerConfig& config);

/**
 * @brief Admission ticket handed out by CircuitBreaker::tryAdmit
 *
 * The generation ties the eventual outcome to the state the permit was
 * issued in; outcomes from an earlier generation are ignored.
 */
struct BreakerPermit {
    bool admitted = false;
    bool probe = false;
    uint64_t generation = 0;
    std::chrono::milliseconds retryAfter{0};  // Remaining OPEN wait when rejected
};

/**
 * @class CircuitBreaker
 * @brief Count-based circuit breaker for one backend
 *
 * State machine:
 *   CLOSED -> OPEN       failure rate >= threshold over >= minimumNumberOfCalls samples
 *   OPEN -> HALF_OPEN    first admit after waitDurationInOpenState
 *   HALF_OPEN -> CLOSED  requiredSuccesses probe successes
 *   HALF_OPEN -> OPEN    any probe failure
 *
 * All state lives under one mutex, so every transition fires exactly once.
 * The transition listener runs after the mutex is released.
 */
class CircuitBreaker {
public:
    using TransitionListener =
        std::function<void(const std::string& name, CircuitState from, CircuitState to)>;

    CircuitBreaker(std::string name, const BreakerConfig& config, std::shared_ptr<IClock> clock);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Ask to send one call to the backend
     *
     * An admitted permit must be completed with onResult exactly once.
     */
    BreakerPermit tryAdmit();

    /**
     * @brief Report the outcome of an admitted call
     *
     * @param permit Permit returned by tryAdmit
     * @param success false for timeouts, connection failures, 5xx and cancellations
     */
    void onResult(const BreakerPermit& permit, bool success);

    CircuitState state() const;
    const std::string& name() const { return name_; }
    const BreakerConfig& config() const { return config_; }

    void setTransitionListener(TransitionListener listener);

    struct Stats {
        CircuitState state;
        size_t windowSamples;
        size_t windowFailures;
        size_t halfOpenProbesInFlight;
        uint64_t rejectedCalls;
        uint64_t totalCalls;
        uint64_t generation;
    };

    Stats getStats() const;

private:
    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    // Callers hold mutex_
    void transitionLocked(CircuitState to, std::vector<Transition>& fired);
    void recordInWindowLocked(bool failure);
    void resetWindowLocked();
    double failureRateLocked() const;

    void notify(const std::vector<Transition>& fired);

    const std::string name_;
    const BreakerConfig config_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint64_t generation_ = 0;

    // Ring buffer of the last slidingWindowSize outcomes (true = failure)
    std::vector<bool> window_;
    size_t windowHead_ = 0;
    size_t windowCount_ = 0;
    size_t windowFailures_ = 0;

    std::chrono::steady_clock::time_point openedAt_;
    size_t halfOpenInFlight_ = 0;
    size_t halfOpenSuccesses_ = 0;

    uint64_t rejectedCalls_ = 0;
    uint64_t totalCalls_ = 0;

    std::mutex listenerMutex_;
    TransitionListener listener_;
};

/**
 * @class BreakerRegistry
 * @brief Name-to-breaker map built once at startup
 *
 * Routes that name the same breaker share its state. The map is never
 * modified after construction, so lookups need no lock.
 */
class BreakerRegistry {
public:
    explicit BreakerRegistry(std::shared_ptr<IClock> clock);

    /**
     * @brief Register a breaker; a second registration under the same name returns the first
     */
    std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& name, const BreakerConfig& config);

    std::shared_ptr<CircuitBreaker> find(const std::string& name) const;

    /**
     * @brief Install the same listener on every registered breaker
     */
    void setTransitionListener(const CircuitBreaker::TransitionListener& listener);

    std::vector<std::shared_ptr<CircuitBreaker>> all() const;

private:
    std::shared_ptr<IClock> clock_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace edge_gateway
