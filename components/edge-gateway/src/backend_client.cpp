// components/edge-gateway/src/backend_client.cpp
#include "edge_gateway/backend_client.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <spdlog/spdlog.h>

#include <array>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace edge_gateway {

namespace {

const std::array<const char*, 9> kHopByHopHeaders = {
    "Connection", "Keep-Alive", "Proxy-Authenticate", "Proxy-Authorization",
    "TE", "Trailer", "Transfer-Encoding", "Upgrade", "Content-Length"
};

bool isHopByHop(const std::string& name) {
    for (const char* header : kHopByHopHeaders) {
        if (iequals(name, header)) {
            return true;
        }
    }
    return false;
}

ForwardOutcome classifyStatus(int status) {
    if (status >= 500) {
        return ForwardOutcome::SERVER_ERROR;
    }
    if (status >= 400) {
        return ForwardOutcome::CLIENT_ERROR;
    }
    return ForwardOutcome::SUCCESS;
}

/**
 * @brief State of one outbound exchange
 *
 * All handlers run on strand_, so finished_ needs no lock.
 */
class ForwardCall : public IForwardCall, public std::enable_shared_from_this<ForwardCall> {
public:
    ForwardCall(net::io_context& ioContext, ForwardRequest request,
                std::chrono::milliseconds timeout, uint64_t bodyLimit, ForwardCallback callback)
        : strand_(net::make_strand(ioContext))
        , resolver_(strand_)
        , stream_(strand_)
        , timer_(strand_)
        , forward_(std::move(request))
        , timeout_(timeout)
        , callback_(std::move(callback))
        , startTime_(std::chrono::steady_clock::now()) {
        parser_.body_limit(bodyLimit);
    }

    void start() {
        net::post(strand_, [self = shared_from_this()]() {
            self->run();
        });
    }

    void cancel() override {
        net::post(strand_, [self = shared_from_this()]() {
            self->finish(ForwardOutcome::CANCELLED, "Cancelled by client disconnect");
        });
    }

private:
    void run() {
        if (finished_) {
            return;
        }

        buildRequest();

        timer_.expires_after(timeout_);
        timer_.async_wait(beast::bind_front_handler(&ForwardCall::onTimeout, shared_from_this()));

        resolver_.async_resolve(forward_.host, std::to_string(forward_.port),
                                beast::bind_front_handler(&ForwardCall::onResolve, shared_from_this()));
    }

    void buildRequest() {
        request_.version(11);
        http::verb verb = http::string_to_verb(forward_.method);
        if (verb == http::verb::unknown) {
            request_.method_string(forward_.method);
        } else {
            request_.method(verb);
        }
        request_.target(forward_.target);

        for (const auto& header : forward_.headers) {
            request_.insert(header.first, header.second);
        }
        request_.set(http::field::host, forward_.host + ":" + std::to_string(forward_.port));
        request_.set(http::field::connection, "close");
        request_.body() = std::move(forward_.body);
        request_.prepare_payload();
    }

    void onTimeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted || finished_) {
            return;
        }
        finish(ForwardOutcome::TIMEOUT,
               "No response within " + std::to_string(timeout_.count()) + " ms");
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (finished_) {
            return;
        }
        if (ec) {
            finish(ForwardOutcome::CONNECTION_FAILURE, "Resolve failed: " + ec.message());
            return;
        }
        stream_.async_connect(results,
                              beast::bind_front_handler(&ForwardCall::onConnect, shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type /*endpoint*/) {
        if (finished_) {
            return;
        }
        if (ec) {
            finish(ForwardOutcome::CONNECTION_FAILURE, "Connect failed: " + ec.message());
            return;
        }
        http::async_write(stream_, request_,
                          beast::bind_front_handler(&ForwardCall::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t /*bytesTransferred*/) {
        if (finished_) {
            return;
        }
        if (ec) {
            finish(ForwardOutcome::CONNECTION_FAILURE, "Write failed: " + ec.message());
            return;
        }
        http::async_read(stream_, buffer_, parser_,
                         beast::bind_front_handler(&ForwardCall::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t /*bytesTransferred*/) {
        if (finished_) {
            return;
        }
        if (ec) {
            finish(ForwardOutcome::CONNECTION_FAILURE, "Read failed: " + ec.message());
            return;
        }

        auto& message = parser_.get();
        GatewayResponse response;
        response.status = static_cast<int>(message.result_int());
        for (const auto& field : message) {
            auto nameView = field.name_string();
            auto valueView = field.value();
            std::string name(nameView.data(), nameView.size());
            if (!isHopByHop(name)) {
                response.headers.emplace_back(std::move(name),
                                              std::string(valueView.data(), valueView.size()));
            }
        }
        response.body = std::move(message.body());

        int status = response.status;
        finish(classifyStatus(status), "", status, std::move(response));
    }

    void finish(ForwardOutcome outcome, const std::string& error,
                int statusCode = 0, GatewayResponse response = GatewayResponse{}) {
        if (finished_) {
            return;
        }
        finished_ = true;

        beast::error_code ignored;
        timer_.cancel();
        resolver_.cancel();
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.socket().close(ignored);

        ForwardResult result;
        result.outcome = outcome;
        result.statusCode = statusCode;
        result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime_);
        result.response = std::move(response);
        result.errorMessage = error;

        if (!error.empty()) {
            spdlog::debug("Forward {} {}:{}{} ended with {}: {}", forward_.method, forward_.host,
                          forward_.port, forward_.target, forwardOutcomeToString(outcome), error);
        }

        ForwardCallback callback = std::move(callback_);
        try {
            callback(std::move(result));
        } catch (const std::exception& e) {
            spdlog::error("Forward completion handler threw: {}", e.what());
        }
    }

    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    net::steady_timer timer_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response_parser<http::string_body> parser_;

    ForwardRequest forward_;
    std::chrono::milliseconds timeout_;
    ForwardCallback callback_;
    std::chrono::steady_clock::time_point startTime_;
    bool finished_ = false;
};

} // anonymous namespace

std::string forwardOutcomeToString(ForwardOutcome outcome) {
    switch (outcome) {
        case ForwardOutcome::SUCCESS:            return "SUCCESS";
        case ForwardOutcome::CLIENT_ERROR:       return "CLIENT_ERROR";
        case ForwardOutcome::SERVER_ERROR:       return "SERVER_ERROR";
        case ForwardOutcome::TIMEOUT:            return "TIMEOUT";
        case ForwardOutcome::CONNECTION_FAILURE: return "CONNECTION_FAILURE";
        case ForwardOutcome::CANCELLED:          return "CANCELLED";
        default:                                 return "UNKNOWN";
    }
}

bool isBreakerFailure(ForwardOutcome outcome) {
    return outcome != ForwardOutcome::SUCCESS && outcome != ForwardOutcome::CLIENT_ERROR;
}

HttpBackendClient::HttpBackendClient(net::io_context& ioContext, const Config& config)
    : ioContext_(ioContext)
    , config_(config) {
}

HttpBackendClient::HttpBackendClient(net::io_context& ioContext)
    : HttpBackendClient(ioContext, Config{}) {
}

std::shared_ptr<IForwardCall> HttpBackendClient::forward(ForwardRequest request,
                                                         std::chrono::milliseconds timeout,
                                                         ForwardCallback callback) {
    auto call = std::make_shared<ForwardCall>(ioContext_, std::move(request), timeout,
                                              config_.maxResponseBodyBytes, std::move(callback));
    call->start();
    return call;
}

} // namespace edge_gateway
