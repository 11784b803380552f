// components/edge-gateway/src/http_server.cpp
#include "edge_gateway/http_server.hpp"

#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace edge_gateway {

HttpServer::HttpServer(const Config& config)
    : config_(config)
    , workGuard_(net::make_work_guard(ioContext_))
    , acceptor_(ioContext_) {
    if (config_.numWorkerThreads == 0) {
        config_.numWorkerThreads = std::max(1u, std::thread::hardware_concurrency());
    }
}

HttpServer::~HttpServer() {
    stop();
    // Workers may never have started; make sure the context is released
    workGuard_.reset();
}

VoidResult HttpServer::start(SessionServices services) {
    if (running_) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION, "Server is already running");
    }
    if (!services.dispatcher || !services.clock) {
        return makeErrorResult(ErrorCode::INVALID_CONFIGURATION,
                               "Server needs a dispatcher and a clock");
    }

    try {
        services_ = std::make_shared<const SessionServices>(std::move(services));

        tcp::endpoint endpoint{net::ip::make_address(config_.address), config_.port};
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        boundPort_ = acceptor_.local_endpoint().port();

        running_ = true;
        doAccept();

        for (size_t i = 0; i < config_.numWorkerThreads; ++i) {
            workerThreads_.emplace_back([this] { this->workerThread(); });
        }

        spdlog::info("HTTP server listening on {}:{} with {} worker threads", config_.address,
                     boundPort_, config_.numWorkerThreads);
        return makeSuccessResult();
    } catch (const std::exception& e) {
        running_ = false;
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return makeErrorResult(ErrorCode::INTERNAL_ERROR,
                               std::string("Failed to start HTTP server: ") + e.what());
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    spdlog::info("Stopping HTTP server");

    boost::system::error_code ec;
    acceptor_.close(ec);

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    spdlog::info("HTTP server stopped");
}

void HttpServer::doAccept() {
    acceptor_.async_accept(net::make_strand(ioContext_),
                           boost::beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec != net::error::operation_aborted) {
            spdlog::error("Accept error: {}", ec.message());
        }
    } else {
        std::make_shared<HttpSession>(std::move(socket), services_)->start();
    }

    if (running_) {
        doAccept();
    }
}

void HttpServer::workerThread() {
    try {
        ioContext_.run();
    } catch (const std::exception& e) {
        spdlog::error("Worker thread exception: {}", e.what());
    }
}

} // namespace edge_gateway
