// components/shared_cache/src/redis_client.cpp
#include "shared_cache/redis_client.hpp"
#include <spdlog/spdlog.h>
#include <cstring>

namespace shared_cache {

namespace {

timeval toTimeval(std::chrono::milliseconds ms) {
    timeval tv;
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(ms.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((ms.count() % 1000) * 1000);
    return tv;
}

bool isStatus(const RedisReply& reply, const char* expected) {
    return reply && reply->type == REDIS_REPLY_STATUS &&
           reply->str && std::strcmp(reply->str, expected) == 0;
}

} // namespace

RedisClient::RedisClient(const std::string& host, int port,
                         const std::string& password,
                         int database,
                         std::chrono::milliseconds connectionTimeout,
                         std::chrono::milliseconds socketTimeout)
    : host_(host), port_(port), password_(password), database_(database),
      connectionTimeout_(connectionTimeout), socketTimeout_(socketTimeout),
      context_(nullptr), connectionStatus_(ConnectionStatus::DISCONNECTED),
      errorCount_(0) {

    spdlog::debug("RedisClient created for {}:{}", host_, port_);
}

RedisClient::~RedisClient() {
    disconnect();
}

bool RedisClient::connect() {
    std::lock_guard<std::mutex> lock(contextMutex_);

    if (context_) {
        redisFree(context_);
        context_ = nullptr;
    }

    connectionStatus_ = ConnectionStatus::CONNECTING;

    context_ = redisConnectWithTimeout(host_.c_str(), port_, toTimeval(connectionTimeout_));

    if (!context_) {
        handleConnectionError("Failed to allocate Redis context");
        return false;
    }

    if (context_->err) {
        handleConnectionError("Connection failed");
        redisFree(context_);
        context_ = nullptr;
        return false;
    }

    if (redisSetTimeout(context_, toTimeval(socketTimeout_)) != REDIS_OK) {
        spdlog::warn("Failed to set socket timeout for Redis connection");
    }

    if (!authenticateLocked() || !selectDatabaseLocked() || !pingLocked()) {
        redisFree(context_);
        context_ = nullptr;
        connectionStatus_ = ConnectionStatus::FAILED;
        return false;
    }

    connectionStatus_ = ConnectionStatus::CONNECTED;
    lastConnectTime_ = std::chrono::system_clock::now();

    spdlog::info("Connected to Redis at {}:{}", host_, port_);
    return true;
}

void RedisClient::disconnect() {
    std::lock_guard<std::mutex> lock(contextMutex_);

    if (context_) {
        redisFree(context_);
        context_ = nullptr;
        spdlog::debug("Disconnected from Redis at {}:{}", host_, port_);
    }

    connectionStatus_ = ConnectionStatus::DISCONNECTED;
}

ConnectionStatus RedisClient::getConnectionStatus() const {
    return connectionStatus_.load();
}

bool RedisClient::exists(const std::string& key, bool& exists) {
    RedisReply reply = executeArgv({"EXISTS", key});

    if (!reply) {
        return false;
    }

    if (reply.isError()) {
        setLastError("Redis error: " + reply.errorText());
        return false;
    }

    exists = reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
    return true;
}

bool RedisClient::setWithExpiry(const std::string& key, const std::string& value,
                                std::chrono::milliseconds ttl) {
    RedisReply reply = executeArgv({"SET", key, value, "PX", std::to_string(ttl.count())});

    if (!reply) {
        return false;
    }

    if (reply.isError()) {
        setLastError("Redis error: " + reply.errorText());
        return false;
    }

    return isStatus(reply, "OK");
}

bool RedisClient::deleteKey(const std::string& key) {
    RedisReply reply = executeArgv({"DEL", key});

    if (!reply || reply.isError()) {
        return false;
    }

    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

RedisReply RedisClient::executeArgv(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(contextMutex_);

    if (!context_ || connectionStatus_ != ConnectionStatus::CONNECTED) {
        handleConnectionError("Not connected to Redis");
        return RedisReply(nullptr);
    }

    RedisReply reply = commandArgvLocked(args);
    if (!reply) {
        handleConnectionError("Command execution failed: " + (args.empty() ? std::string() : args.front()));
    }
    return reply;
}

bool RedisClient::ping() {
    std::lock_guard<std::mutex> lock(contextMutex_);

    if (!context_ || connectionStatus_ != ConnectionStatus::CONNECTED) {
        return false;
    }

    return pingLocked();
}

std::string RedisClient::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

bool RedisClient::authenticateLocked() {
    if (password_.empty()) {
        return true;
    }

    RedisReply reply = commandArgvLocked({"AUTH", password_});

    if (!reply) {
        handleConnectionError("AUTH command failed");
        return false;
    }

    if (reply.isError()) {
        handleConnectionError("Authentication failed: " + reply.errorText());
        return false;
    }

    return isStatus(reply, "OK");
}

bool RedisClient::selectDatabaseLocked() {
    if (database_ == 0) {
        return true;
    }

    RedisReply reply = commandArgvLocked({"SELECT", std::to_string(database_)});

    if (!reply || reply.isError()) {
        handleConnectionError("SELECT " + std::to_string(database_) + " failed");
        return false;
    }

    return isStatus(reply, "OK");
}

bool RedisClient::pingLocked() {
    RedisReply reply = commandArgvLocked({"PING"});
    return isStatus(reply, "PONG");
}

RedisReply RedisClient::commandArgvLocked(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());

    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    return RedisReply(static_cast<redisReply*>(
        redisCommandArgv(context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
}

void RedisClient::handleConnectionError(const std::string& operation) {
    connectionStatus_ = ConnectionStatus::FAILED;
    errorCount_++;

    std::string fullError = operation;
    if (context_ && context_->err) {
        fullError += ": " + std::string(context_->errstr);
    }

    setLastError(fullError);
    spdlog::error("Redis connection error [{}:{}]: {}", host_, port_, fullError);
}

void RedisClient::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

} // namespace shared_cache
