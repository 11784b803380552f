// components/edge-gateway/src/circuit_breaker.cpp
#include "edge_gateway/circuit_breaker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace edge_gateway {

std::string circuitStateToString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default:                      return "UNKNOWN";
    }
}

VoidResult validateBreakerConfig(const BreakerConfig& config) {
    if (config.slidingWindowSize == 0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION, "slidingWindowSize must be > 0");
    }
    if (config.minimumNumberOfCalls == 0 || config.minimumNumberOfCalls > config.slidingWindowSize) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION,
                               "minCalls must be between 1 and slidingWindowSize");
    }
    if (config.failureRateThreshold <= 0.0 || config.failureRateThreshold > 100.0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION,
                               "failureRateThreshold must be in (0, 100]");
    }
    if (config.waitDurationInOpenState.count() < 0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION, "waitDuration must not be negative");
    }
    if (config.maxHalfOpenProbes == 0 || config.requiredSuccesses == 0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION,
                               "maxHalfOpenProbes and requiredSuccesses must be > 0");
    }
    return makeSuccessResult();
}

CircuitBreaker::CircuitBreaker(std::string name, const BreakerConfig& config,
                               std::shared_ptr<IClock> clock)
    : name_(std::move(name))
    , config_(config)
    , clock_(std::move(clock))
    , window_(config.slidingWindowSize, false) {
    auto valid = validateBreakerConfig(config_);
    if (!valid) {
        throw std::invalid_argument("Breaker '" + name_ + "': " + valid.errorMessage);
    }
    if (!clock_) {
        throw std::invalid_argument("Breaker '" + name_ + "' requires a clock");
    }
}

BreakerPermit CircuitBreaker::tryAdmit() {
    std::vector<Transition> fired;
    BreakerPermit permit;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == CircuitState::OPEN) {
            auto elapsed = clock_->now() - openedAt_;
            if (elapsed >= config_.waitDurationInOpenState) {
                transitionLocked(CircuitState::HALF_OPEN, fired);
            } else {
                permit.retryAfter = std::chrono::duration_cast<std::chrono::milliseconds>(
                    config_.waitDurationInOpenState - elapsed);
            }
        }

        switch (state_) {
            case CircuitState::CLOSED:
                permit.admitted = true;
                break;
            case CircuitState::HALF_OPEN:
                if (halfOpenInFlight_ < config_.maxHalfOpenProbes) {
                    ++halfOpenInFlight_;
                    permit.admitted = true;
                    permit.probe = true;
                }
                break;
            case CircuitState::OPEN:
                break;
        }

        permit.generation = generation_;
        if (permit.admitted) {
            ++totalCalls_;
        } else {
            ++rejectedCalls_;
        }
    }

    notify(fired);
    return permit;
}

void CircuitBreaker::onResult(const BreakerPermit& permit, bool success) {
    if (!permit.admitted) {
        return;
    }

    std::vector<Transition> fired;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Stale outcome: the breaker has moved on since this call was admitted
        if (permit.generation != generation_) {
            return;
        }

        if (state_ == CircuitState::CLOSED) {
            recordInWindowLocked(!success);
            if (windowCount_ >= config_.minimumNumberOfCalls &&
                failureRateLocked() >= config_.failureRateThreshold) {
                transitionLocked(CircuitState::OPEN, fired);
            }
        } else if (state_ == CircuitState::HALF_OPEN && permit.probe) {
            if (halfOpenInFlight_ > 0) {
                --halfOpenInFlight_;
            }
            if (!success) {
                transitionLocked(CircuitState::OPEN, fired);
            } else if (++halfOpenSuccesses_ >= config_.requiredSuccesses) {
                transitionLocked(CircuitState::CLOSED, fired);
            }
        }
    }

    notify(fired);
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void CircuitBreaker::setTransitionListener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

CircuitBreaker::Stats CircuitBreaker::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{state_, windowCount_, windowFailures_, halfOpenInFlight_,
                 rejectedCalls_, totalCalls_, generation_};
}

void CircuitBreaker::transitionLocked(CircuitState to, std::vector<Transition>& fired) {
    CircuitState from = state_;
    state_ = to;
    ++generation_;

    switch (to) {
        case CircuitState::OPEN:
            openedAt_ = clock_->now();
            break;
        case CircuitState::HALF_OPEN:
            halfOpenInFlight_ = 0;
            halfOpenSuccesses_ = 0;
            break;
        case CircuitState::CLOSED:
            resetWindowLocked();
            break;
    }

    fired.push_back(Transition{from, to});
}

void CircuitBreaker::recordInWindowLocked(bool failure) {
    if (windowCount_ == window_.size()) {
        // Overwrite the oldest sample
        if (window_[windowHead_]) {
            --windowFailures_;
        }
    } else {
        ++windowCount_;
    }

    window_[windowHead_] = failure;
    if (failure) {
        ++windowFailures_;
    }
    windowHead_ = (windowHead_ + 1) % window_.size();
}

void CircuitBreaker::resetWindowLocked() {
    std::fill(window_.begin(), window_.end(), false);
    windowHead_ = 0;
    windowCount_ = 0;
    windowFailures_ = 0;
}

double CircuitBreaker::failureRateLocked() const {
    if (windowCount_ == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(windowFailures_) / static_cast<double>(windowCount_);
}

void CircuitBreaker::notify(const std::vector<Transition>& fired) {
    if (fired.empty()) {
        return;
    }

    TransitionListener listener;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener = listener_;
    }

    for (const auto& transition : fired) {
        if (transition.to == CircuitState::OPEN) {
            spdlog::warn("Circuit breaker '{}' {} -> OPEN", name_, circuitStateToString(transition.from));
        } else {
            spdlog::info("Circuit breaker '{}' {} -> {}", name_,
                         circuitStateToString(transition.from), circuitStateToString(transition.to));
        }

        if (listener) {
            try {
                listener(name_, transition.from, transition.to);
            } catch (const std::exception& e) {
                spdlog::error("Breaker transition listener failed for '{}': {}", name_, e.what());
            }
        }
    }
}

// BreakerRegistry implementation
BreakerRegistry::BreakerRegistry(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::getOrCreate(const std::string& name,
                                                             const BreakerConfig& config) {
    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }

    auto breaker = std::make_shared<CircuitBreaker>(name, config, clock_);
    breakers_.emplace(name, breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::find(const std::string& name) const {
    auto it = breakers_.find(name);
    return it == breakers_.end() ? nullptr : it->second;
}

void BreakerRegistry::setTransitionListener(const CircuitBreaker::TransitionListener& listener) {
    for (auto& entry : breakers_) {
        entry.second->setTransitionListener(listener);
    }
}

std::vector<std::shared_ptr<CircuitBreaker>> BreakerRegistry::all() const {
    std::vector<std::shared_ptr<CircuitBreaker>> result;
    result.reserve(breakers_.size());
    for (const auto& entry : breakers_) {
        result.push_back(entry.second);
    }
    return result;
}

} // namespace edge_gateway
