// components/metrics_sink/include/metrics_sink/prometheus_sink.hpp
#pragma once

#include "metrics_sink/metrics_sink.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace prometheus {
class Registry;
}

namespace metrics_sink {

/**
 * @class PrometheusMetricsSink
 * @brief Metrics sink backed by a prometheus-cpp registry
 *
 * In asynchronous mode events are pushed onto a bounded queue and applied by
 * a single worker thread; when the queue is full the event is dropped and
 * counted. Synchronous mode applies events on the calling thread.
 */
class PrometheusMetricsSink : public IMetricsSink {
public:
    struct Config {
        bool asynchronous = true;
        size_t queueCapacity = 10000;
        std::vector<double> latencyBuckets{0.001, 0.005, 0.01, 0.025, 0.05, 0.1,
                                           0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
    };

    explicit PrometheusMetricsSink(const Config& config,
                                   std::shared_ptr<prometheus::Registry> registry = nullptr);
    ~PrometheusMetricsSink() override;

    PrometheusMetricsSink(const PrometheusMetricsSink&) = delete;
    PrometheusMetricsSink& operator=(const PrometheusMetricsSink&) = delete;

    /**
     * @brief Start the worker thread (no-op in synchronous mode)
     */
    void start();

    /**
     * @brief Drain the queue and stop the worker thread
     */
    void stop();

    void record(const RequestEvent& event) noexcept override;
    void recordBreakerTransition(const std::string& breakerName,
                                 const std::string& fromState,
                                 const std::string& toState) noexcept override;

    /**
     * @brief Prometheus text exposition of every registered family
     */
    std::string exposition() const;

    std::shared_ptr<prometheus::Registry> registry() const { return registry_; }

    // Read-back helpers
    double requestCount(const std::string& routeId, RequestOutcome outcome, int statusCode) const;
    uint64_t latencySampleCount(const std::string& routeId) const;
    double breakerStateValue(const std::string& breakerName) const;
    double transitionCount(const std::string& breakerName, const std::string& fromState,
                           const std::string& toState) const;
    double droppedCount() const;

private:
    struct TransitionEvent {
        std::string breakerName;
        std::string fromState;
        std::string toState;
    };

    using QueuedEvent = std::variant<RequestEvent, TransitionEvent>;

    class Families;

    void enqueue(QueuedEvent event) noexcept;
    void apply(const QueuedEvent& event) noexcept;
    void applyRequest(const RequestEvent& event);
    void applyTransition(const TransitionEvent& event);
    void workerLoop();

    Config config_;
    std::shared_ptr<prometheus::Registry> registry_;
    std::unique_ptr<Families> families_;

    std::deque<QueuedEvent> queue_;
    std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    std::thread worker_;
    std::atomic<bool> running_{false};
};

/**
 * @brief Numeric gauge value for a breaker state name (-1 if unknown)
 */
double breakerStateToGauge(const std::string& state);

/**
 * @brief "2xx", "4xx", ... or "none" for statuses outside 100-599
 */
std::string statusClass(int statusCode);

} // namespace metrics_sink
