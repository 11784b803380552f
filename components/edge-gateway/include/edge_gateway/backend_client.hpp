// components/edge-gateway/include/edge_gateway/backend_client.hpp
#pragma once

#include "edge_gateway/types.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace edge_gateway {

// One outbound HTTP call
struct ForwardRequest {
    std::string method;
    std::string host;
    uint16_t port = 80;
    std::string target;     // Path and query
    HeaderList headers;
    std::string body;
};

enum class ForwardOutcome {
    SUCCESS,             // 1xx-3xx
    CLIENT_ERROR,        // 4xx
    SERVER_ERROR,        // 5xx
    TIMEOUT,
    CONNECTION_FAILURE,
    CANCELLED            // Client went away before the backend answered
};

std::string forwardOutcomeToString(ForwardOutcome outcome);

/**
 * @brief Whether an outcome counts against the backend's breaker
 *
 * 4xx responses are the caller's fault and do not.
 */
bool isBreakerFailure(ForwardOutcome outcome);

struct ForwardResult {
    ForwardOutcome outcome = ForwardOutcome::CONNECTION_FAILURE;
    int statusCode = 0;                          // 0 when no response arrived
    std::chrono::microseconds latency{0};
    GatewayResponse response;                    // Valid when statusCode != 0
    std::string errorMessage;

    bool succeeded() const { return !isBreakerFailure(outcome); }
};

using ForwardCallback = std::function<void(ForwardResult)>;

/**
 * @brief Handle of an in-flight forward
 */
class IForwardCall {
public:
    virtual ~IForwardCall() = default;

    /**
     * @brief Abort the call; the callback fires with CANCELLED unless it already fired
     */
    virtual void cancel() = 0;
};

/**
 * @class IBackendClient
 * @brief Asynchronous HTTP client used to reach backend services
 */
class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    /**
     * @brief Send one request
     *
     * The callback is invoked exactly once, from an io_context thread, with
     * the response or the reason there is none. No retries are made.
     */
    virtual std::shared_ptr<IForwardCall> forward(ForwardRequest request,
                                                  std::chrono::milliseconds timeout,
                                                  ForwardCallback callback) = 0;
};

/**
 * @class HttpBackendClient
 * @brief Boost.Beast HTTP/1.1 client, one connection per call
 *
 * Every call runs resolve, connect, write and read on its own strand with a
 * deadline timer covering the whole exchange.
 */
class HttpBackendClient : public IBackendClient {
public:
    struct Config {
        uint64_t maxResponseBodyBytes = 16 * 1024 * 1024;
    };

    HttpBackendClient(boost::asio::io_context& ioContext, const Config& config);
    explicit HttpBackendClient(boost::asio::io_context& ioContext);

    std::shared_ptr<IForwardCall> forward(ForwardRequest request,
                                          std::chrono::milliseconds timeout,
                                          ForwardCallback callback) override;

private:
    boost::asio::io_context& ioContext_;
    Config config_;
};

} // namespace edge_gateway
