// components/shared_cache/src/types.cpp
#include "shared_cache/types.hpp"
#include <sstream>

namespace shared_cache {

std::string toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTED:    return "CONNECTED";
        case ConnectionStatus::DISCONNECTED: return "DISCONNECTED";
        case ConnectionStatus::CONNECTING:   return "CONNECTING";
        case ConnectionStatus::FAILED:       return "FAILED";
        default:                             return "UNKNOWN";
    }
}

std::string toString(const ConnectionPoolStats& stats) {
    std::ostringstream oss;
    oss << "ConnectionPoolStats{total=" << stats.totalConnections
        << ", active=" << stats.activeConnections
        << ", idle=" << stats.idleConnections
        << ", failed=" << stats.failedConnections
        << ", reconnects=" << stats.reconnectAttempts << "}";
    return oss.str();
}

bool isValid(const CacheConfig& config) {
    if (config.host.empty()) {
        return false;
    }
    if (config.port <= 0 || config.port > 65535) {
        return false;
    }
    if (config.connectionPoolSize <= 0) {
        return false;
    }
    if (config.database < 0) {
        return false;
    }
    return config.connectionTimeout.count() > 0 && config.socketTimeout.count() > 0;
}

} // namespace shared_cache
