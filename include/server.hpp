#pragma once

#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "router.hpp"

namespace http = boost::beast::http;

namespace imitatus {

// One connection: read a single request, dispatch it, write the response and
// close.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket socket,
           std::shared_ptr<Router> router,
           std::uint64_t body_limit)
        : socket_(std::move(socket))
        , router_(std::move(router))
        , body_limit_(body_limit) {}

    void start();

private:
    void read_request();
    void on_read(boost::system::error_code ec);
    void handle_request();
    void write_response();
    // Discards what the client still sends so the close is not a reset
    void drain_request();
    std::string get_client_ip(const http::request<http::string_body>& req) const;

    boost::asio::ip::tcp::socket socket_;
    boost::beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    http::response<http::string_body> response_;
    std::shared_ptr<Router> router_;
    std::uint64_t body_limit_;
    bool drain_after_write_ = false;
    std::uint64_t drained_ = 0;
    std::array<char, 8192> drain_buffer_;
};

class Server {
public:
    Server(const std::string& address, unsigned short port,
           std::shared_ptr<Router> router,
           int threads = 1,
           std::uint64_t body_limit = 5 * 1024 * 1024);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Blocks until stop() is called (or a signal arrives, when enabled)
    void run();
    void stop();

    // Stop on SIGINT/SIGTERM; call before run()
    void handle_signals();

    // Bound port, useful when constructed with port 0
    unsigned short port() const;

private:
    void accept();
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    std::shared_ptr<Router> router_;
    int threads_;
    std::uint64_t body_limit_;
    std::atomic<bool> running_{false};
};
} // namespace imitatus
