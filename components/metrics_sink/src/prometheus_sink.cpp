// components/metrics_sink/src/prometheus_sink.cpp
#include "metrics_sink/prometheus_sink.hpp"

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <prometheus/text_serializer.h>
#include <spdlog/spdlog.h>

namespace metrics_sink {

std::string outcomeToString(RequestOutcome outcome) {
    switch (outcome) {
        case RequestOutcome::SUCCESS:            return "success";
        case RequestOutcome::CLIENT_ERROR:       return "client_error";
        case RequestOutcome::SERVER_ERROR:       return "server_error";
        case RequestOutcome::TIMEOUT:            return "timeout";
        case RequestOutcome::CONNECTION_FAILURE: return "connection_failure";
        case RequestOutcome::CANCELLED:          return "cancelled";
        case RequestOutcome::NOT_FOUND:          return "not_found";
        case RequestOutcome::UNAUTHORIZED:       return "unauthorized";
        case RequestOutcome::FORBIDDEN:          return "forbidden";
        case RequestOutcome::RATE_LIMITED:       return "rate_limited";
        case RequestOutcome::SHORT_CIRCUITED:    return "short_circuited";
        case RequestOutcome::INTERNAL_ERROR:     return "internal_error";
        default:                                 return "unknown";
    }
}

double breakerStateToGauge(const std::string& state) {
    if (state == "CLOSED") return 0.0;
    if (state == "OPEN") return 1.0;
    if (state == "HALF_OPEN") return 2.0;
    return -1.0;
}

std::string statusClass(int statusCode) {
    if (statusCode < 100 || statusCode > 599) {
        return "none";
    }
    return std::to_string(statusCode / 100) + "xx";
}

namespace {

// Unmatched requests are labelled with a fixed route so cardinality stays bounded
std::string routeLabel(const std::string& routeId) {
    return routeId.empty() ? "unmatched" : routeId;
}

} // namespace

// Prometheus metric families owned by the sink
class PrometheusMetricsSink::Families {
public:
    explicit Families(prometheus::Registry& registry)
        : requests(prometheus::BuildCounter()
                       .Name("edge_gateway_requests_total")
                       .Help("Requests handled, by route, outcome and status class")
                       .Register(registry))
        , latency(prometheus::BuildHistogram()
                      .Name("edge_gateway_request_duration_seconds")
                      .Help("End-to-end request latency as seen by the gateway")
                      .Register(registry))
        , breakerState(prometheus::BuildGauge()
                           .Name("edge_gateway_breaker_state")
                           .Help("Circuit breaker state (0=closed, 1=open, 2=half-open)")
                           .Register(registry))
        , breakerTransitions(prometheus::BuildCounter()
                                 .Name("edge_gateway_breaker_transitions_total")
                                 .Help("Circuit breaker state transitions")
                                 .Register(registry))
        , dropped(prometheus::BuildCounter()
                      .Name("edge_gateway_metrics_dropped_total")
                      .Help("Metric events dropped because the sink queue was full")
                      .Register(registry)
                      .Add({})) {}

    prometheus::Family<prometheus::Counter>& requests;
    prometheus::Family<prometheus::Histogram>& latency;
    prometheus::Family<prometheus::Gauge>& breakerState;
    prometheus::Family<prometheus::Counter>& breakerTransitions;
    prometheus::Counter& dropped;
};

PrometheusMetricsSink::PrometheusMetricsSink(const Config& config,
                                             std::shared_ptr<prometheus::Registry> registry)
    : config_(config)
    , registry_(registry ? std::move(registry) : std::make_shared<prometheus::Registry>())
    , families_(std::make_unique<Families>(*registry_)) {
}

PrometheusMetricsSink::~PrometheusMetricsSink() {
    stop();
}

void PrometheusMetricsSink::start() {
    if (!config_.asynchronous || running_.exchange(true)) {
        return;
    }

    worker_ = std::thread(&PrometheusMetricsSink::workerLoop, this);
    spdlog::debug("Metrics sink worker started (queue capacity {})", config_.queueCapacity);
}

void PrometheusMetricsSink::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    queueCondition_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::debug("Metrics sink worker stopped");
}

void PrometheusMetricsSink::record(const RequestEvent& event) noexcept {
    try {
        enqueue(QueuedEvent{event});
    } catch (const std::exception& e) {
        spdlog::warn("Failed to record request metric: {}", e.what());
    }
}

void PrometheusMetricsSink::recordBreakerTransition(const std::string& breakerName,
                                                    const std::string& fromState,
                                                    const std::string& toState) noexcept {
    try {
        enqueue(QueuedEvent{TransitionEvent{breakerName, fromState, toState}});
    } catch (const std::exception& e) {
        spdlog::warn("Failed to record breaker transition metric: {}", e.what());
    }
}

void PrometheusMetricsSink::enqueue(QueuedEvent event) noexcept {
    if (!config_.asynchronous || !running_.load()) {
        apply(event);
        return;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (queue_.size() >= config_.queueCapacity) {
                families_->dropped.Increment();
                return;
            }
            queue_.push_back(std::move(event));
        }
        queueCondition_.notify_one();
    } catch (const std::exception& e) {
        families_->dropped.Increment();
        spdlog::warn("Metrics queue push failed: {}", e.what());
    }
}

void PrometheusMetricsSink::apply(const QueuedEvent& event) noexcept {
    try {
        if (const auto* request = std::get_if<RequestEvent>(&event)) {
            applyRequest(*request);
        } else if (const auto* transition = std::get_if<TransitionEvent>(&event)) {
            applyTransition(*transition);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to apply metric event: {}", e.what());
    }
}

void PrometheusMetricsSink::applyRequest(const RequestEvent& event) {
    const std::string route = routeLabel(event.routeId);

    families_->requests.Add({{"route", route},
                             {"outcome", outcomeToString(event.outcome)},
                             {"status_class", statusClass(event.statusCode)}})
        .Increment();

    families_->latency.Add({{"route", route}},
                           prometheus::Histogram::BucketBoundaries(config_.latencyBuckets))
        .Observe(std::chrono::duration<double>(event.latency).count());

    if (!event.breakerName.empty()) {
        double value = breakerStateToGauge(event.breakerStateAfter);
        if (value >= 0.0) {
            families_->breakerState.Add({{"breaker", event.breakerName}}).Set(value);
        }
    }
}

void PrometheusMetricsSink::applyTransition(const TransitionEvent& event) {
    families_->breakerTransitions.Add({{"breaker", event.breakerName},
                                       {"from", event.fromState},
                                       {"to", event.toState}})
        .Increment();

    double value = breakerStateToGauge(event.toState);
    if (value >= 0.0) {
        families_->breakerState.Add({{"breaker", event.breakerName}}).Set(value);
    }
}

void PrometheusMetricsSink::workerLoop() {
    while (true) {
        std::deque<QueuedEvent> batch;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });

            if (queue_.empty() && !running_.load()) {
                break;
            }
            batch.swap(queue_);
        }

        for (const auto& event : batch) {
            apply(event);
        }
    }
}

std::string PrometheusMetricsSink::exposition() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

double PrometheusMetricsSink::requestCount(const std::string& routeId, RequestOutcome outcome,
                                           int statusCode) const {
    prometheus::Labels labels{{"route", routeLabel(routeId)},
                              {"outcome", outcomeToString(outcome)},
                              {"status_class", statusClass(statusCode)}};
    if (!families_->requests.Has(labels)) {
        return 0.0;
    }
    return families_->requests.Add(labels).Value();
}

uint64_t PrometheusMetricsSink::latencySampleCount(const std::string& routeId) const {
    prometheus::Labels labels{{"route", routeLabel(routeId)}};
    if (!families_->latency.Has(labels)) {
        return 0;
    }
    return families_->latency
        .Add(labels, prometheus::Histogram::BucketBoundaries(config_.latencyBuckets))
        .Collect()
        .histogram.sample_count;
}

double PrometheusMetricsSink::breakerStateValue(const std::string& breakerName) const {
    prometheus::Labels labels{{"breaker", breakerName}};
    if (!families_->breakerState.Has(labels)) {
        return -1.0;
    }
    return families_->breakerState.Add(labels).Value();
}

double PrometheusMetricsSink::transitionCount(const std::string& breakerName,
                                              const std::string& fromState,
                                              const std::string& toState) const {
    prometheus::Labels labels{{"breaker", breakerName}, {"from", fromState}, {"to", toState}};
    if (!families_->breakerTransitions.Has(labels)) {
        return 0.0;
    }
    return families_->breakerTransitions.Add(labels).Value();
}

double PrometheusMetricsSink::droppedCount() const {
    return families_->dropped.Value();
}

} // namespace metrics_sink
