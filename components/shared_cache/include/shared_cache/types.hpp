// components/shared_cache/include/shared_cache/types.hpp
#pragma once

#include <chrono>
#include <string>
#include <cstdint>

namespace shared_cache {

/**
 * @brief Configuration for the shared Redis cache
 */
struct CacheConfig {
    // Redis server
    std::string host = "localhost";
    int port = 6379;
    std::string password;
    int database = 0;

    // Connection Pool Settings
    int connectionPoolSize = 4;
    std::chrono::milliseconds connectionTimeout{5000};
    std::chrono::milliseconds socketTimeout{1000};
    std::chrono::milliseconds checkoutTimeout{200};

    // Health monitoring
    std::chrono::milliseconds healthCheckInterval{10000};
};

/**
 * @brief Redis connection status
 */
enum class ConnectionStatus {
    CONNECTED,
    DISCONNECTED,
    CONNECTING,
    FAILED
};

/**
 * @brief Connection pool statistics
 */
struct ConnectionPoolStats {
    int totalConnections = 0;
    int activeConnections = 0;
    int idleConnections = 0;
    int failedConnections = 0;
    int reconnectAttempts = 0;
    std::chrono::system_clock::time_point lastConnectionTime;
    std::chrono::system_clock::time_point lastFailureTime;
};

std::string toString(ConnectionStatus status);
std::string toString(const ConnectionPoolStats& stats);

bool isValid(const CacheConfig& config);

} // namespace shared_cache
