// components/shared_cache/src/connection_pool.cpp
#include "shared_cache/connection_pool.hpp"
#include <spdlog/spdlog.h>

namespace shared_cache {

// PooledConnection Implementation
PooledConnection::PooledConnection(std::shared_ptr<RedisClient> client,
                                   std::function<void(std::shared_ptr<RedisClient>)> returnFunc)
    : client_(std::move(client)), returnFunc_(std::move(returnFunc)), released_(false) {
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : client_(std::move(other.client_)), returnFunc_(std::move(other.returnFunc_)),
      released_(other.released_) {
    other.released_ = true;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();

        client_ = std::move(other.client_);
        returnFunc_ = std::move(other.returnFunc_);
        released_ = other.released_;

        other.released_ = true;
    }
    return *this;
}

PooledConnection::~PooledConnection() {
    release();
}

void PooledConnection::release() {
    if (!released_ && client_ && returnFunc_) {
        returnFunc_(client_);
        released_ = true;
    }
}

// ConnectionPool Implementation
ConnectionPool::ConnectionPool(const CacheConfig& config)
    : config_(config), lastConnectionTime_(std::chrono::system_clock::now()),
      lastFailureTime_(std::chrono::system_clock::time_point::min()) {

    spdlog::debug("ConnectionPool created with pool size: {}", config_.connectionPoolSize);
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

bool ConnectionPool::initialize() {
    if (initialized_.load()) {
        spdlog::warn("ConnectionPool already initialized");
        return true;
    }

    spdlog::info("Initializing Redis connection pool for {}:{} with {} connections",
                 config_.host, config_.port, config_.connectionPoolSize);

    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        for (int i = 0; i < config_.connectionPoolSize; ++i) {
            auto connection = createConnection();
            if (!connection) {
                spdlog::error("Failed to create connection {} during initialization", i + 1);
                break;
            }
            availableConnections_.push(connection);
            totalConnections_++;
        }
    }

    shuttingDown_ = false;
    initialized_ = true;
    healthMonitorThread_ = std::thread(&ConnectionPool::healthMonitorLoop, this);

    if (totalConnections_.load() == 0) {
        spdlog::error("Redis unreachable at {}:{}, health monitor will keep retrying",
                      config_.host, config_.port);
        return false;
    }

    spdlog::info("ConnectionPool initialized with {} connections", totalConnections_.load());
    return true;
}

void ConnectionPool::shutdown() {
    if (!initialized_.load()) {
        return;
    }

    spdlog::info("Shutting down Redis connection pool");

    {
        std::lock_guard<std::mutex> lock(monitorMutex_);
        shuttingDown_ = true;
    }
    monitorWake_.notify_all();
    connectionAvailable_.notify_all();

    if (healthMonitorThread_.joinable()) {
        healthMonitorThread_.join();
    }

    std::lock_guard<std::mutex> lock(poolMutex_);
    while (!availableConnections_.empty()) {
        availableConnections_.pop();
    }

    totalConnections_ = 0;
    activeConnections_ = 0;
    initialized_ = false;
}

PooledConnection ConnectionPool::getConnection() {
    return getConnection(config_.checkoutTimeout);
}

PooledConnection ConnectionPool::getConnection(std::chrono::milliseconds timeout) {
    if (!initialized_.load() || shuttingDown_.load()) {
        return PooledConnection();
    }

    std::unique_lock<std::mutex> lock(poolMutex_);

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (availableConnections_.empty() && !shuttingDown_.load()) {
        if (totalConnections_.load() == 0) {
            // Nothing checked out that could come back
            return PooledConnection();
        }
        if (connectionAvailable_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::warn("Timeout waiting for available Redis connection");
            return PooledConnection();
        }
    }

    if (shuttingDown_.load() || availableConnections_.empty()) {
        return PooledConnection();
    }

    auto connection = availableConnections_.front();
    availableConnections_.pop();
    activeConnections_++;

    return PooledConnection(connection,
        [this](std::shared_ptr<RedisClient> client) {
            this->returnConnection(std::move(client));
        });
}

bool ConnectionPool::isHealthy() const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    return !availableConnections_.empty() || activeConnections_.load() > 0;
}

ConnectionPoolStats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(poolMutex_);

    ConnectionPoolStats stats;
    stats.totalConnections = totalConnections_.load();
    stats.activeConnections = activeConnections_.load();
    stats.idleConnections = static_cast<int>(availableConnections_.size());
    stats.failedConnections = failedConnections_.load();
    stats.reconnectAttempts = reconnectAttempts_.load();

    std::lock_guard<std::mutex> timesLock(timesMutex_);
    stats.lastConnectionTime = lastConnectionTime_;
    stats.lastFailureTime = lastFailureTime_;

    return stats;
}

std::shared_ptr<RedisClient> ConnectionPool::createConnection() {
    try {
        auto client = std::make_shared<RedisClient>(
            config_.host, config_.port, config_.password, config_.database,
            config_.connectionTimeout, config_.socketTimeout);

        if (client->connect()) {
            std::lock_guard<std::mutex> lock(timesMutex_);
            lastConnectionTime_ = std::chrono::system_clock::now();
            return client;
        }

        std::lock_guard<std::mutex> lock(timesMutex_);
        lastFailureTime_ = std::chrono::system_clock::now();
        return nullptr;
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(timesMutex_);
            lastFailureTime_ = std::chrono::system_clock::now();
        }
        spdlog::error("Exception creating connection to {}:{}: {}", config_.host, config_.port, e.what());
        return nullptr;
    }
}

void ConnectionPool::returnConnection(std::shared_ptr<RedisClient> client) {
    if (!client) {
        return;
    }

    std::lock_guard<std::mutex> lock(poolMutex_);

    activeConnections_--;

    if (shuttingDown_.load()) {
        return;
    }

    if (client->getConnectionStatus() == ConnectionStatus::CONNECTED) {
        availableConnections_.push(std::move(client));
        connectionAvailable_.notify_one();
    } else {
        failedConnections_++;
        totalConnections_--;
        spdlog::debug("Discarding failed Redis connection");
        connectionAvailable_.notify_all();
    }
}

void ConnectionPool::healthMonitorLoop() {
    spdlog::debug("Redis health monitor started");

    while (true) {
        {
            std::unique_lock<std::mutex> lock(monitorMutex_);
            monitorWake_.wait_for(lock, config_.healthCheckInterval,
                                  [this] { return shuttingDown_.load(); });
            if (shuttingDown_.load()) {
                break;
            }
        }

        try {
            int replaced = replaceFailedConnections();
            if (replaced > 0) {
                spdlog::info("Opened {} replacement Redis connections", replaced);
            }
        } catch (const std::exception& e) {
            spdlog::error("Exception in Redis health monitor: {}", e.what());
        }
    }

    spdlog::debug("Redis health monitor stopped");
}

int ConnectionPool::replaceFailedConnections() {
    int needed = 0;
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        needed = config_.connectionPoolSize - totalConnections_.load();
    }

    if (needed <= 0) {
        return 0;
    }

    // Connect outside the pool lock, connect timeouts can be long
    std::vector<std::shared_ptr<RedisClient>> created;
    for (int i = 0; i < needed; ++i) {
        reconnectAttempts_++;
        auto connection = createConnection();
        if (!connection) {
            break;
        }
        created.push_back(std::move(connection));
    }

    if (created.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(poolMutex_);
    for (auto& connection : created) {
        availableConnections_.push(std::move(connection));
        totalConnections_++;
    }
    connectionAvailable_.notify_all();

    return static_cast<int>(created.size());
}

} // namespace shared_cache
