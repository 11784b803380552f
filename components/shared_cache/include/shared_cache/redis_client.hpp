// components/shared_cache/include/shared_cache/redis_client.hpp
#pragma once

#include "shared_cache/types.hpp"
#include <hiredis/hiredis.h>
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <atomic>
#include <mutex>

namespace shared_cache {

/**
 * @brief RAII wrapper for Redis replies
 */
class RedisReply {
public:
    explicit RedisReply(redisReply* reply) : reply_(reply) {}
    ~RedisReply() { if (reply_) freeReplyObject(reply_); }

    RedisReply(RedisReply&& other) noexcept : reply_(other.reply_) {
        other.reply_ = nullptr;
    }

    RedisReply& operator=(RedisReply&& other) noexcept {
        if (this != &other) {
            if (reply_) freeReplyObject(reply_);
            reply_ = other.reply_;
            other.reply_ = nullptr;
        }
        return *this;
    }

    RedisReply(const RedisReply&) = delete;
    RedisReply& operator=(const RedisReply&) = delete;

    redisReply* get() const { return reply_; }
    redisReply* operator->() const { return reply_; }
    explicit operator bool() const { return reply_ != nullptr; }

    bool isError() const { return reply_ && reply_->type == REDIS_REPLY_ERROR; }

    /**
     * @brief Error text of an error reply, empty otherwise
     */
    std::string errorText() const {
        if (!isError() || !reply_->str) {
            return "";
        }
        return std::string(reply_->str, reply_->len);
    }

private:
    redisReply* reply_;
};

/**
 * @brief Thread-safe Redis client wrapper
 */
class RedisClient {
public:
    /**
     * @brief Constructor
     * @param host Redis server hostname
     * @param port Redis server port
     * @param password Optional password for authentication
     * @param database Logical database selected after connect
     * @param connectionTimeout Connection timeout in milliseconds
     * @param socketTimeout Socket timeout in milliseconds
     */
    RedisClient(const std::string& host, int port,
                const std::string& password = "",
                int database = 0,
                std::chrono::milliseconds connectionTimeout = std::chrono::milliseconds{5000},
                std::chrono::milliseconds socketTimeout = std::chrono::milliseconds{1000});

    ~RedisClient();

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    /**
     * @brief Connect to Redis server
     * @return true if connection successful
     */
    bool connect();

    /**
     * @brief Disconnect from Redis server
     */
    void disconnect();

    ConnectionStatus getConnectionStatus() const;

    /**
     * @brief Check whether a key exists
     * @param key Redis key
     * @param exists Set to the result when the call succeeds
     * @return false if the command could not be executed
     */
    bool exists(const std::string& key, bool& exists);

    /**
     * @brief SET key value PX ttl
     * @return true if the key was written
     */
    bool setWithExpiry(const std::string& key, const std::string& value,
                       std::chrono::milliseconds ttl);

    /**
     * @brief Delete a key
     * @return true if key was deleted
     */
    bool deleteKey(const std::string& key);

    /**
     * @brief Execute a command given as an argument vector
     *
     * Arguments are passed binary-safe, so keys and script bodies need no quoting.
     * @return Redis reply wrapped in RAII object, empty on connection failure
     */
    RedisReply executeArgv(const std::vector<std::string>& args);

    /**
     * @brief Ping the Redis server
     * @return true if ping successful
     */
    bool ping();

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::chrono::system_clock::time_point getLastConnectTime() const { return lastConnectTime_; }

    std::string getLastError() const;
    int getErrorCount() const { return errorCount_.load(); }

private:
    std::string host_;
    int port_;
    std::string password_;
    int database_;
    std::chrono::milliseconds connectionTimeout_;
    std::chrono::milliseconds socketTimeout_;

    redisContext* context_;
    mutable std::mutex contextMutex_;

    std::atomic<ConnectionStatus> connectionStatus_;
    std::chrono::system_clock::time_point lastConnectTime_;

    std::atomic<int> errorCount_;
    std::string lastError_;
    mutable std::mutex errorMutex_;

    // The following helpers expect contextMutex_ to be held
    bool authenticateLocked();
    bool selectDatabaseLocked();
    bool pingLocked();
    RedisReply commandArgvLocked(const std::vector<std::string>& args);

    void handleConnectionError(const std::string& operation);
    void setLastError(const std::string& error);
};

} // namespace shared_cache
