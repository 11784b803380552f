// components/edge-gateway/include/edge_gateway/clock.hpp
#pragma once

#include <chrono>
#include <mutex>

namespace edge_gateway {

/**
 * @class IClock
 * @brief Time source shared by the rate limiter, breakers and auth gate
 */
class IClock {
public:
    virtual ~IClock() = default;

    // Monotonic time for durations
    virtual std::chrono::steady_clock::time_point now() const = 0;

    // Wall time for token expiry and timestamps
    virtual std::chrono::system_clock::time_point wallTime() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    std::chrono::system_clock::time_point wallTime() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Clock that only moves when told to; both time lines advance together
 */
class ManualClock : public IClock {
public:
    ManualClock()
        : steady_(std::chrono::steady_clock::now())
        , wall_(std::chrono::system_clock::now()) {}

    std::chrono::steady_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return steady_;
    }

    std::chrono::system_clock::time_point wallTime() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return wall_;
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        steady_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(delta);
        wall_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
    }

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point steady_;
    std::chrono::system_clock::time_point wall_;
};

} // namespace edge_gateway
