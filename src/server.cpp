#include "server.hpp"
#include "api_error.hpp"
#include "logging.hpp"
#include "responses.hpp"
#include <csignal>
#include <limits>
#include <thread>
#include <vector>

namespace imitatus {

namespace {

// Upper bound on request bytes discarded after an early 413
constexpr std::uint64_t MAX_DRAIN_BYTES = 16 * 1024 * 1024;

} // namespace

Server::Server(const std::string& address, unsigned short port,
              std::shared_ptr<Router> router,
              int threads,
              std::uint64_t body_limit)
    : acceptor_(io_context_),
      signals_(io_context_),
      router_(std::move(router)),
      threads_(threads < 1 ? 1 : threads),
      body_limit_(body_limit) {

    boost::asio::ip::tcp::endpoint endpoint{
        boost::asio::ip::make_address(address),
        port
    };

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

unsigned short Server::port() const {
    return acceptor_.local_endpoint().port();
}

void Server::handle_signals() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (!ec) {
            Logger::get().info("Received signal {}, shutting down the server...", signal_number);
            stop();
        }
    });
}

void Server::run() {
    running_ = true;
    accept();

    std::vector<std::thread> workers;
    workers.reserve(threads_ - 1);
    for (int i = 1; i < threads_; ++i) {
        workers.emplace_back([this]() { io_context_.run(); });
    }
    io_context_.run();

    for (auto& worker : workers) {
        worker.join();
    }
}

void Server::stop() {
    running_ = false;
    io_context_.stop();
}

void Server::accept() {
    if (!running_) return;

    acceptor_.async_accept(
        [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!ec) {
                std::make_shared<Session>(std::move(socket), router_, body_limit_)->start();
            } else {
                Logger::get().warn("Failed to accept connection: {}", ec.message());
            }
            accept();
        });
}

void Session::start() {
    read_request();
}

void Session::read_request() {
    auto self = shared_from_this();

    parser_.emplace();
    parser_->body_limit(body_limit_ > 0 ? body_limit_ : std::numeric_limits<std::uint64_t>::max());

    http::async_read(
        socket_,
        buffer_,
        *parser_,
        [self](boost::system::error_code ec, std::size_t) {
            self->on_read(ec);
        });
}

void Session::on_read(boost::system::error_code ec) {
    if (ec == http::error::body_limit) {
        Logger::get().warn("Rejected request body larger than {} bytes", body_limit_);
        response_ = make_error_response(PayloadTooLargeError(), parser_->get().version());
        apply_standard_headers(response_);
        response_.keep_alive(false);
        drain_after_write_ = true;
        write_response();
        return;
    }
    if (ec) {
        if (ec != http::error::end_of_stream) {
            Logger::get().debug("Dropping connection after read error: {}", ec.message());
        }
        boost::system::error_code close_ec;
        socket_.close(close_ec);
        return;
    }
    handle_request();
}

std::string Session::get_client_ip(const http::request<http::string_body>& req) const {
    // Check X-Forwarded-For header first
    auto fwd_header = req.find("X-Forwarded-For");
    if (fwd_header != req.end()) {
        std::string forwarded_ips(fwd_header->value().data(), fwd_header->value().size());
        // Get the first IP in the list (original client)
        size_t pos = forwarded_ips.find(',');
        if (pos != std::string::npos) {
            return forwarded_ips.substr(0, pos);
        }
        return forwarded_ips;
    }

    // Fall back to direct connection IP
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "";
    }
    return endpoint.address().to_string();
}

void Session::handle_request() {
    auto request = parser_->release();

    try {
        response_ = router_->handle_request(request, get_client_ip(request));
    } catch (const std::exception& e) {
        Logger::get().error("Failed to dispatch {} {}: {}",
                            std::string(request.method_string()), std::string(request.target()), e.what());
        response_ = make_internal_error_response(request.version());
        apply_standard_headers(response_);
        response_.keep_alive(false);
    }

    write_response();
}

void Session::write_response() {
    auto self = shared_from_this();
    http::async_write(
        socket_,
        response_,
        [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                Logger::get().debug("Failed to write response: {}", ec.message());
            }
            boost::system::error_code shutdown_ec;
            self->socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, shutdown_ec);
            if (shutdown_ec && shutdown_ec != boost::asio::error::not_connected) {
                Logger::get().debug("Socket shutdown failed: {}", shutdown_ec.message());
            }
            if (self->drain_after_write_ && !ec) {
                self->drain_request();
            }
        });
}

void Session::drain_request() {
    auto self = shared_from_this();
    socket_.async_read_some(
        boost::asio::buffer(drain_buffer_),
        [self](boost::system::error_code ec, std::size_t bytes) {
            self->drained_ += bytes;
            if (!ec && self->drained_ < MAX_DRAIN_BYTES) {
                self->drain_request();
                return;
            }
            if (ec && ec != boost::asio::error::eof) {
                Logger::get().debug("Stopped draining request body: {}", ec.message());
            }
            boost::system::error_code close_ec;
            self->socket_.close(close_ec);
        });
}

} // namespace imitatus
