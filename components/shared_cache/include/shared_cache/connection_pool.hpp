// components/shared_cache/include/shared_cache/connection_pool.hpp
#pragma once

#include "shared_cache/redis_client.hpp"
#include "shared_cache/types.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>
#include <functional>

namespace shared_cache {

/**
 * @brief RAII connection holder that automatically returns connection to pool
 */
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(std::shared_ptr<RedisClient> client,
                     std::function<void(std::shared_ptr<RedisClient>)> returnFunc);

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    ~PooledConnection();

    RedisClient* operator->() { return client_.get(); }
    RedisClient& operator*() { return *client_; }

    explicit operator bool() const { return client_ != nullptr; }

    // Release the connection back to pool manually
    void release();

private:
    std::shared_ptr<RedisClient> client_;
    std::function<void(std::shared_ptr<RedisClient>)> returnFunc_;
    bool released_ = false;
};

/**
 * @brief Thread-safe Redis connection pool with health monitoring
 *
 * Connections that fail while checked out are discarded on return and the
 * health monitor tops the pool back up to its configured size.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const CacheConfig& config);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Open the initial connections and start the health monitor
     *
     * The monitor is started even when Redis is unreachable so that the
     * pool recovers once the server comes back.
     * @return true if at least one connection was opened
     */
    bool initialize();

    void shutdown();

    /**
     * @brief Get a connection from the pool
     * @param timeout Maximum time to wait for a connection
     * @return RAII connection holder, or invalid holder if timeout/error
     */
    PooledConnection getConnection(std::chrono::milliseconds timeout);
    PooledConnection getConnection();

    /**
     * @brief Check if pool is healthy (has live connections)
     */
    bool isHealthy() const;

    ConnectionPoolStats getStats() const;

private:
    CacheConfig config_;

    std::queue<std::shared_ptr<RedisClient>> availableConnections_;

    mutable std::mutex poolMutex_;
    std::condition_variable connectionAvailable_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> shuttingDown_{false};

    std::atomic<int> totalConnections_{0};
    std::atomic<int> activeConnections_{0};
    std::atomic<int> failedConnections_{0};
    std::atomic<int> reconnectAttempts_{0};
    // Written by connect attempts with or without poolMutex_ held
    mutable std::mutex timesMutex_;
    std::chrono::system_clock::time_point lastConnectionTime_;
    std::chrono::system_clock::time_point lastFailureTime_;

    std::thread healthMonitorThread_;
    std::mutex monitorMutex_;
    std::condition_variable monitorWake_;

    std::shared_ptr<RedisClient> createConnection();
    void returnConnection(std::shared_ptr<RedisClient> client);
    void healthMonitorLoop();

    /**
     * @brief Replace failed connections with new ones
     * @return Number of connections created
     */
    int replaceFailedConnections();
};

} // namespace shared_cache
