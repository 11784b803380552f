// components/edge-gateway/src/http_session.cpp
#include "edge_gateway/http_session.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace edge_gateway {

namespace {

constexpr std::size_t kMaxPipelinedBytes = 64 * 1024;

GatewayResponse jsonResponse(int status, const nlohmann::json& body) {
    GatewayResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = body.dump();
    return response;
}

const char* reasonFor(int status) {
    switch (status) {
        case 499: return "Client Closed Request";
        default:  return nullptr;
    }
}

} // anonymous namespace

std::optional<GatewayResponse> answerLocally(const GatewayRequest& request,
                                             const SessionServices& services) {
    const bool isGet = iequals(request.method, "GET");

    if (isGet && request.path == "/health") {
        return jsonResponse(200, {{"status", "UP"}});
    }

    if (isGet && request.path == "/ready") {
        bool ready = !services.readiness || services.readiness();
        return jsonResponse(ready ? 200 : 503, {{"status", ready ? "UP" : "DOWN"}});
    }

    if (isGet && request.path == "/metrics" && services.metricsText) {
        GatewayResponse response;
        response.headers.emplace_back("Content-Type", "text/plain; version=0.0.4");
        response.body = services.metricsText();
        return response;
    }

    if (services.cors && services.cors->isPreflight(request)) {
        return services.cors->preflight(request, services.dispatcher->routes(),
                                        services.clock->wallTime());
    }

    return std::nullopt;
}

void finalizeResponse(const GatewayRequest& request, GatewayResponse& response,
                      const SessionServices& services) {
    setHeader(response.headers, "X-Frame-Options", "DENY");
    setHeader(response.headers, "X-Content-Type-Options", "nosniff");
    setHeader(response.headers, "Strict-Transport-Security", "max-age=31536000; includeSubDomains");

    if (services.cors) {
        services.cors->decorate(request, response);
    }
}

HttpSession::HttpSession(tcp::socket socket, std::shared_ptr<const SessionServices> services)
    : stream_(std::move(socket))
    , services_(std::move(services)) {
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        remoteAddress_ = endpoint.address().to_string();
    }
}

void HttpSession::start() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    parser_.emplace();
    parser_->body_limit(services_->maxRequestBodyBytes);

    stream_.expires_after(services_->idleTimeout);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytesTransferred*/) {
    if (ec == http::error::end_of_stream) {
        doClose();
        return;
    }

    if (ec == http::error::body_limit) {
        keepAlive_ = false;
        auto response = makeErrorResponse(ErrorCode::BAD_REQUEST, "Request body too large",
                                          services_->clock->wallTime());
        response.status = 413;
        writeResponse(std::move(response));
        return;
    }

    if (ec) {
        if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
            spdlog::debug("Read error from {}: {}", remoteAddress_, ec.message());
        }
        return;
    }

    processRequest();
}

GatewayRequest HttpSession::toGatewayRequest() const {
    const auto& message = parser_->get();

    GatewayRequest request;
    auto method = message.method_string();
    request.method.assign(method.data(), method.size());

    auto target = message.target();
    auto parts = splitTarget(std::string(target.data(), target.size()));
    request.path = parts.first;
    request.query = parts.second;

    for (const auto& field : message) {
        auto name = field.name_string();
        auto value = field.value();
        request.headers.emplace_back(std::string(name.data(), name.size()),
                                     std::string(value.data(), value.size()));
    }
    request.body = message.body();
    request.remoteAddress = remoteAddress_;
    return request;
}

void HttpSession::processRequest() {
    keepAlive_ = parser_->get().keep_alive();
    current_ = toGatewayRequest();

    std::optional<GatewayResponse> local;
    try {
        local = answerLocally(current_, *services_);
    } catch (const std::exception& e) {
        spdlog::error("Local endpoint {} failed: {}", current_.path, e.what());
        local = makeErrorResponse(ErrorCode::INTERNAL_ERROR, "Internal gateway error",
                                  services_->clock->wallTime());
    }
    if (local) {
        writeResponse(std::move(*local));
        return;
    }

    // The backend call may take longer than the idle timeout
    stream_.expires_never();
    awaitingBackend_ = true;

    auto self = shared_from_this();
    pending_ = services_->dispatcher->handle(current_, [self](GatewayResponse response) {
        net::post(self->stream_.get_executor(),
                  [self, response = std::move(response)]() mutable {
                      self->onDispatched(std::move(response));
                  });
    });

    watchForDisconnect();
}

void HttpSession::watchForDisconnect() {
    if (!awaitingBackend_) {
        return;
    }
    // Stop watching once a pipelining client has sent a lot ahead
    if (buffer_.size() >= kMaxPipelinedBytes) {
        return;
    }
    stream_.socket().async_read_some(net::buffer(peek_),
                                     beast::bind_front_handler(&HttpSession::onClientData,
                                                               shared_from_this()));
}

void HttpSession::onClientData(beast::error_code ec, std::size_t bytesTransferred) {
    if (ec == net::error::operation_aborted) {
        return;
    }

    if (bytesTransferred > 0) {
        // Pipelined bytes; the parser picks them up after this response
        auto space = buffer_.prepare(bytesTransferred);
        net::buffer_copy(space, net::buffer(peek_.data(), bytesTransferred));
        buffer_.commit(bytesTransferred);
    }

    if (ec) {
        keepAlive_ = false;
        if (awaitingBackend_) {
            spdlog::debug("Client {} disconnected during {} {}", remoteAddress_, current_.method,
                          current_.path);
            if (pending_) {
                pending_->cancel();
            }
        }
        return;
    }

    watchForDisconnect();
}

void HttpSession::onDispatched(GatewayResponse response) {
    awaitingBackend_ = false;
    pending_.reset();

    beast::error_code ignored;
    stream_.socket().cancel(ignored);

    writeResponse(std::move(response));
}

void HttpSession::writeResponse(GatewayResponse response) {
    finalizeResponse(current_, response, *services_);

    auto message = std::make_shared<http::response<http::string_body>>();
    message->version(11);
    message->result(static_cast<unsigned>(response.status));
    if (const char* reason = reasonFor(response.status)) {
        message->reason(reason);
    }
    for (const auto& header : response.headers) {
        message->insert(header.first, header.second);
    }
    message->body() = std::move(response.body);
    message->keep_alive(keepAlive_);
    message->prepare_payload();

    response_ = message;
    stream_.expires_after(services_->idleTimeout);
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                                response_->need_eof()));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytesTransferred*/) {
    if (ec) {
        spdlog::debug("Write error to {}: {}", remoteAddress_, ec.message());
        return;
    }

    response_.reset();

    if (close) {
        doClose();
        return;
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace edge_gateway
