// components/edge-gateway/include/edge_gateway/http_server.hpp
#pragma once

#include "edge_gateway/http_session.hpp"
#include "edge_gateway/types.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace edge_gateway {

/**
 * @class HttpServer
 * @brief Boost.Beast HTTP/1.1 front end
 *
 * Owns the io_context shared by inbound sessions and outbound backend
 * calls. Each accepted connection gets its own strand.
 */
class HttpServer {
public:
    struct Config {
        std::string address = "0.0.0.0";
        uint16_t port = 8080;                // 0 picks an ephemeral port
        size_t numWorkerThreads = 0;         // 0 means hardware concurrency
    };

    explicit HttpServer(const Config& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief io_context to build the backend client on before start
     */
    boost::asio::io_context& ioContext() { return ioContext_; }

    /**
     * @brief Bind, listen and start the worker threads
     */
    VoidResult start(SessionServices services);

    /**
     * @brief Stop accepting and join the workers; in-flight requests are dropped
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief Port actually bound, useful when configured with 0
     */
    uint16_t boundPort() const { return boundPort_; }

private:
    void doAccept();
    void onAccept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
    void workerThread();

    Config config_;
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> workerThreads_;
    std::atomic<bool> running_{false};
    uint16_t boundPort_ = 0;

    std::shared_ptr<const SessionServices> services_;
};

} // namespace edge_gateway
