#include "CheckinServer.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr const char* kCheckinPath = "/api/v1/checkin";
constexpr const char* kApiKeyHeader = "X-API-Key";
constexpr std::uint64_t kMaxBodyBytes = 8 * 1024 * 1024;
constexpr auto kIdleTimeout = std::chrono::seconds(30);

std::string ToStd(beast::string_view value) {
    return std::string(value.data(), value.size());
}

class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket&& socket, CheckinHandler& handler, const std::string& apiKey)
        : stream_(std::move(socket)),
          handler_(handler),
          apiKey_(apiKey) {}

    void Start() {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Connection::Read, shared_from_this()));
    }

private:
    void Read() {
        parser_.emplace();
        parser_->body_limit(kMaxBodyBytes);
        stream_.expires_after(kIdleTimeout);
        http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&Connection::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code error, std::size_t) {
        if (error == http::error::end_of_stream) {
            Close();
            return;
        }
        if (error) {
            if (error != beast::error::timeout && error != net::error::operation_aborted) {
                std::cerr << "[Server] Read failed: " << error.message() << std::endl;
            }
            return;
        }

        http::request<http::string_body> request = parser_->release();
        const HttpReply reply = RouteCheckin(
            handler_,
            apiKey_,
            ToStd(request.method_string()),
            ToStd(request.target()),
            ToStd(request[kApiKeyHeader]),
            request.body());

        response_ = std::make_shared<http::response<http::string_body>>(
            static_cast<http::status>(reply.status),
            request.version());
        response_->set(http::field::server, "checkin-server");
        response_->set(http::field::content_type, "application/json");
        response_->keep_alive(request.keep_alive());
        response_->body() = reply.body;
        response_->prepare_payload();

        http::async_write(
            stream_,
            *response_,
            beast::bind_front_handler(&Connection::OnWrite, shared_from_this(), response_->keep_alive()));
    }

    void OnWrite(bool keepAlive, beast::error_code error, std::size_t) {
        if (error) {
            std::cerr << "[Server] Write failed: " << error.message() << std::endl;
            return;
        }
        if (!keepAlive) {
            Close();
            return;
        }
        Read();
    }

    void Close() {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<http::response<http::string_body>> response_;
    CheckinHandler& handler_;
    const std::string& apiKey_;
};
} // namespace

HttpReply RouteCheckin(
    CheckinHandler& handler,
    const std::string& expectedApiKey,
    const std::string& method,
    const std::string& target,
    const std::string& presentedApiKey,
    const std::string& body) {
    HttpReply reply;
    const std::string path = target.substr(0, target.find('?'));
    if (path != kCheckinPath) {
        reply.status = 404;
        return reply;
    }
    if (method != "POST") {
        reply.status = 405;
        return reply;
    }

    // A wrong key looks exactly like an idle check-in from the outside.
    const bool authenticated = expectedApiKey.empty() || presentedApiKey == expectedApiKey;
    const CheckinOutcome outcome = handler.Handle(body, authenticated);
    reply.body = SerializeCheckinResponse(outcome.response);
    return reply;
}

CheckinServer::CheckinServer(CheckinHandler& handler, const DispatchConfig& config)
    : handler_(handler),
      config_(config),
      acceptor_(io_) {}

CheckinServer::~CheckinServer() {
    Stop();
}

bool CheckinServer::Start() {
    if (running_.exchange(true)) {
        return true;
    }

    beast::error_code error;
    const auto address = net::ip::make_address(config_.listenHost, error);
    if (error) {
        std::cerr << "[Server] Invalid listen host " << config_.listenHost << ": " << error.message() << std::endl;
        running_ = false;
        return false;
    }

    const tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.listenPort));
    acceptor_.open(endpoint.protocol(), error);
    if (!error) {
        acceptor_.set_option(net::socket_base::reuse_address(true), error);
    }
    if (!error) {
        acceptor_.bind(endpoint, error);
    }
    if (!error) {
        acceptor_.listen(net::socket_base::max_listen_connections, error);
    }
    if (error) {
        std::cerr << "[Server] Cannot listen on " << config_.listenHost << ":" << config_.listenPort
                  << ": " << error.message() << std::endl;
        beast::error_code ignored;
        acceptor_.close(ignored);
        running_ = false;
        return false;
    }

    AcceptNext();

    const int threads = std::max(1, config_.workerThreads);
    workers_.reserve(static_cast<size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() {
            io_.run();
        });
    }

    std::cout << "[Server] Listening on " << config_.listenHost << ":" << Port() << " with " << threads
              << " worker(s)" << std::endl;
    return true;
}

void CheckinServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    io_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    beast::error_code ignored;
    acceptor_.close(ignored);
    std::cout << "[Server] Stopped" << std::endl;
}

unsigned short CheckinServer::Port() const {
    beast::error_code error;
    const auto endpoint = acceptor_.local_endpoint(error);
    return error ? 0 : endpoint.port();
}

void CheckinServer::AcceptNext() {
    acceptor_.async_accept(net::make_strand(io_), [this](beast::error_code error, tcp::socket socket) {
        if (error) {
            if (error != net::error::operation_aborted) {
                std::cerr << "[Server] Accept failed: " << error.message() << std::endl;
            }
        } else {
            std::make_shared<Connection>(std::move(socket), handler_, config_.apiKey)->Start();
        }

        if (running_ && acceptor_.is_open()) {
            AcceptNext();
        }
    });
}
