#pragma once

#include "CheckinHandler.hpp"
#include "Config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

struct HttpReply {
    int status = 200;
    std::string body = "{}";
};

// Maps one HTTP request onto the check-in handler.
HttpReply RouteCheckin(
    CheckinHandler& handler,
    const std::string& expectedApiKey,
    const std::string& method,
    const std::string& target,
    const std::string& presentedApiKey,
    const std::string& body);

// HTTP/1.1 listener. The io_context runs on workerThreads threads, so
// check-ins from different clients are served in parallel.
class CheckinServer {
public:
    CheckinServer(CheckinHandler& handler, const DispatchConfig& config);
    ~CheckinServer();

    // Binds, listens and starts the worker threads. Returns immediately.
    bool Start();
    // Closes the listener and joins the workers; open connections are dropped.
    void Stop();

    unsigned short Port() const;

private:
    void AcceptNext();

    CheckinHandler& handler_;
    DispatchConfig config_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
};
