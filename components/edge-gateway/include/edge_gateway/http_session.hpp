// components/edge-gateway/include/edge_gateway/http_session.hpp
#pragma once

#include "edge_gateway/clock.hpp"
#include "edge_gateway/cors_policy.hpp"
#include "edge_gateway/dispatcher.hpp"
#include "edge_gateway/types.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace edge_gateway {

/**
 * @brief Everything a session needs to answer requests
 */
struct SessionServices {
    std::shared_ptr<Dispatcher> dispatcher;
    std::shared_ptr<const CorsPolicy> cors;         // May be null
    std::function<bool()> readiness;                // May be empty: always ready
    std::function<std::string()> metricsText;       // May be empty: /metrics is 404
    std::shared_ptr<IClock> clock;
    uint64_t maxRequestBodyBytes = 10 * 1024 * 1024;
    std::chrono::seconds idleTimeout{60};
};

/**
 * @brief Answer /health, /ready, /metrics and CORS preflights
 * @return nullopt if the request belongs to the pipeline
 */
std::optional<GatewayResponse> answerLocally(const GatewayRequest& request,
                                             const SessionServices& services);

/**
 * @brief Add security headers and, for allowed origins, CORS headers
 */
void finalizeResponse(const GatewayRequest& request, GatewayResponse& response,
                      const SessionServices& services);

/**
 * @class HttpSession
 * @brief One client connection: read, dispatch, write, repeat
 *
 * While a request is with the backend the session keeps reading the client
 * socket. Pipelined bytes are buffered for the next request; a client that
 * closes its side cancels the forward.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const SessionServices> services);

    void start();

private:
    void doRead();
    void onRead(boost::beast::error_code ec, std::size_t bytesTransferred);
    void processRequest();
    void watchForDisconnect();
    void onClientData(boost::beast::error_code ec, std::size_t bytesTransferred);
    void onDispatched(GatewayResponse response);
    void writeResponse(GatewayResponse response);
    void onWrite(bool close, boost::beast::error_code ec, std::size_t bytesTransferred);
    void doClose();

    GatewayRequest toGatewayRequest() const;

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::array<char, 4096> peek_{};
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> response_;
    std::shared_ptr<const SessionServices> services_;

    GatewayRequest current_;
    bool keepAlive_ = false;
    bool awaitingBackend_ = false;
    std::shared_ptr<PendingRequest> pending_;
    std::string remoteAddress_;
};

} // namespace edge_gateway
