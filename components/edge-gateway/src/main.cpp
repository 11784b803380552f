// components/edge-gateway/src/main.cpp
#include "edge_gateway/auth_gate.hpp"
#include "edge_gateway/backend_client.hpp"
#include "edge_gateway/circuit_breaker.hpp"
#include "edge_gateway/clock.hpp"
#include "edge_gateway/config.hpp"
#include "edge_gateway/cors_policy.hpp"
#include "edge_gateway/dispatcher.hpp"
#include "edge_gateway/http_server.hpp"
#include "edge_gateway/rate_limiter.hpp"
#include "edge_gateway/redis_rate_limiter.hpp"
#include "edge_gateway/revocation_store.hpp"
#include "edge_gateway/route_table.hpp"
#include "metrics_sink/prometheus_sink.hpp"
#include "shared_cache/connection_pool.hpp"

#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace po = boost::program_options;

// Global signal handler
std::atomic<bool> g_running(true);

void signalHandler(int /*signal*/) {
    g_running = false;
}

namespace {

void setupLogging(const edge_gateway::LoggingConfig& logging) {
    auto logger = spdlog::stdout_color_mt("edge_gateway");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        po::options_description desc("Edge gateway options");
        desc.add_options()
            ("help,h", "Print help message")
            ("config,c", po::value<std::string>()->default_value("config/gateway.json"), "Configuration file")
            ("address,a", po::value<std::string>(), "Listen address (overrides config)")
            ("port,p", po::value<uint16_t>(), "Listen port (overrides config)")
            ("threads,t", po::value<size_t>(), "Number of worker threads, 0 = auto (overrides config)")
            ("log-level,l", po::value<std::string>(), "trace, debug, info, warn, error (overrides config)");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        auto loaded = edge_gateway::ConfigLoader::loadFromFile(vm["config"].as<std::string>());
        if (!loaded) {
            std::cerr << "Failed to load configuration: "
                      << edge_gateway::errorCodeToString(loaded.errorCode)
                      << " - " << loaded.errorMessage << std::endl;
            return 1;
        }
        edge_gateway::GatewayConfig config = std::move(loaded.value);

        if (vm.count("address")) {
            config.server.address = vm["address"].as<std::string>();
        }
        if (vm.count("port")) {
            config.server.port = vm["port"].as<uint16_t>();
        }
        if (vm.count("threads")) {
            config.server.threads = vm["threads"].as<size_t>();
        }
        if (vm.count("log-level")) {
            config.logging.level = vm["log-level"].as<std::string>();
        }

        setupLogging(config.logging);

        auto clock = std::make_shared<edge_gateway::SystemClock>();

        // Shared cache
        std::shared_ptr<shared_cache::ConnectionPool> pool;
        if (config.redis.enabled) {
            pool = std::make_shared<shared_cache::ConnectionPool>(config.redis.cache);
            if (!pool->initialize()) {
                spdlog::warn("Redis at {}:{} is not reachable yet; retrying in the background",
                             config.redis.cache.host, config.redis.cache.port);
            }
        }

        std::shared_ptr<edge_gateway::IRevocationStore> revocation;
        if (config.revocationStore == "redis") {
            edge_gateway::RedisRevocationStore::Config revocationConfig;
            revocationConfig.checkoutTimeout = config.redis.cache.checkoutTimeout;
            revocation = std::make_shared<edge_gateway::RedisRevocationStore>(pool, revocationConfig);
        } else if (config.revocationStore == "local") {
            revocation = std::make_shared<edge_gateway::LocalRevocationStore>();
        }

        auto authGate = std::make_shared<edge_gateway::AuthGate>(config.auth, revocation, clock);

        edge_gateway::TokenBucketRateLimiter::Config limiterConfig;
        limiterConfig.shardCount = config.rateLimit.shardCount;
        limiterConfig.idleTtl = config.rateLimit.idleTtl;
        limiterConfig.sweepInterval = config.rateLimit.sweepInterval;
        std::shared_ptr<edge_gateway::IRateLimiter> rateLimiter =
            std::make_shared<edge_gateway::TokenBucketRateLimiter>(limiterConfig, clock);
        if (config.rateLimit.store == "redis") {
            edge_gateway::RedisRateLimiter::Config redisLimiterConfig;
            redisLimiterConfig.idleTtl = config.rateLimit.idleTtl;
            redisLimiterConfig.checkoutTimeout = config.redis.cache.checkoutTimeout;
            rateLimiter = std::make_shared<edge_gateway::RedisRateLimiter>(pool, rateLimiter,
                                                                           redisLimiterConfig);
        }

        auto routes = edge_gateway::RouteTable::build(config.routes);
        if (!routes) {
            spdlog::error("Invalid route configuration: {}", routes.errorMessage);
            return 1;
        }

        std::shared_ptr<metrics_sink::IMetricsSink> metrics;
        std::shared_ptr<metrics_sink::PrometheusMetricsSink> prometheusSink;
        if (config.metrics.enabled) {
            metrics_sink::PrometheusMetricsSink::Config sinkConfig;
            sinkConfig.asynchronous = config.metrics.asynchronous;
            sinkConfig.queueCapacity = config.metrics.queueCapacity;
            prometheusSink = std::make_shared<metrics_sink::PrometheusMetricsSink>(sinkConfig);
            prometheusSink->start();
            metrics = prometheusSink;
        } else {
            metrics = std::make_shared<metrics_sink::NullMetricsSink>();
        }

        edge_gateway::HttpServer::Config serverConfig;
        serverConfig.address = config.server.address;
        serverConfig.port = config.server.port;
        serverConfig.numWorkerThreads = config.server.threads;
        edge_gateway::HttpServer server(serverConfig);

        auto backend = std::make_shared<edge_gateway::HttpBackendClient>(server.ioContext());
        auto breakers = std::make_shared<edge_gateway::BreakerRegistry>(clock);
        auto dispatcher = std::make_shared<edge_gateway::Dispatcher>(
            config.dispatcher, routes.value, authGate, rateLimiter, breakers, backend, metrics, clock);

        edge_gateway::SessionServices services;
        services.dispatcher = dispatcher;
        services.cors = std::make_shared<const edge_gateway::CorsPolicy>(config.cors);
        services.readiness = [authGate]() { return authGate->isReady(); };
        if (prometheusSink) {
            services.metricsText = [prometheusSink]() { return prometheusSink->exposition(); };
        }
        services.clock = clock;
        services.maxRequestBodyBytes = config.server.maxRequestBodyBytes;
        services.idleTimeout = config.server.idleTimeout;

        auto started = server.start(std::move(services));
        if (!started) {
            spdlog::error("Failed to start gateway: {} - {}",
                          edge_gateway::errorCodeToString(started.errorCode), started.errorMessage);
            return 1;
        }

        spdlog::info("Edge gateway started with {} routes", routes.value->size());

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down");
        server.stop();
        if (prometheusSink) {
            prometheusSink->stop();
        }
        if (pool) {
            pool->shutdown();
        }
        spdlog::info("Edge gateway stopped");

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
