#include <gtest/gtest.h>
#include "server.hpp"
#include "routes.hpp"
#include "server_context.hpp"
#include "logging.hpp"
#include <thread>
#include <chrono>
#include <set>
#include <boost/beast/http.hpp>
#include <boost/beast/core.hpp>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

using namespace imitatus;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using nlohmann::json;

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Initialize logger for tests
        Logger::init("info");

        // Port 0 lets the OS pick a free port
        address_ = "127.0.0.1";

        context_ = std::make_shared<ServerContext>(std::make_shared<MemoryResourceStore>());
        router_ = build_router(context_);
    }

    void start(int threads = 1, std::uint64_t body_limit = 5 * 1024 * 1024) {
        server_ = std::make_unique<Server>(address_, 0, router_, threads, body_limit);
        port_ = server_->port();
        server_thread_ = std::thread([this]() { server_->run(); });

        // Give the server a moment to start
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    // Helper to send HTTP request and get response
    http::response<http::string_body> send_request(http::request<http::string_body> request) {
        net::io_context io_context;
        tcp::socket socket(io_context);
        socket.connect(tcp::endpoint(net::ip::make_address(address_), port_));

        if (request.find(http::field::host) == request.end()) {
            request.set(http::field::host, address_ + ":" + std::to_string(port_));
        }
        request.prepare_payload();

        http::write(socket, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);

        boost::system::error_code ec;
        socket.close(ec);
        return res;
    }

    http::request<http::string_body> make_request(http::verb method, const std::string& target,
                                                  const std::string& body = "") {
        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::user_agent, "ServerTest");
        if (!token_.empty()) {
            req.set(http::field::authorization, "Bearer " + token_);
        }
        if (!body.empty()) {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        return req;
    }

    void login() {
        auto res = send_request(make_request(http::verb::post, "/api/login",
                                             R"({"username":"admin","password":"password"})"));
        ASSERT_EQ(res.result(), http::status::ok);
        token_ = json::parse(res.body())["token"].get<std::string>();
    }

    std::string address_;
    unsigned short port_ = 0;
    std::shared_ptr<ServerContext> context_;
    std::shared_ptr<Router> router_;
    std::unique_ptr<Server> server_;
    std::thread server_thread_;
    std::string token_;
};

TEST_F(ServerTest, ServerInitialization) {
    ASSERT_NO_THROW({
        Server server(address_, 0, router_);
        EXPECT_NE(server.port(), 0);
    });
}

TEST_F(ServerTest, ServerStartStop) {
    start();
    server_->stop();
    server_thread_.join();
}

TEST_F(ServerTest, ConnectionTest) {
    start();

    // Create a client and try to connect
    net::io_context io_context;
    tcp::socket socket(io_context);

    ASSERT_NO_THROW({
        socket.connect(tcp::endpoint(net::ip::make_address(address_), port_));
    });

    socket.close();
}

TEST_F(ServerTest, LoginCreateAndFetchOverTcp) {
    start();
    login();

    auto created = send_request(make_request(http::verb::post, "/api/items",
                                             R"({"name":"Test Item","price":29.99})"));
    ASSERT_EQ(created.result(), http::status::created);
    EXPECT_EQ(created[http::field::server], "Imitatus 0.1.0");
    EXPECT_FALSE(created.keep_alive());
    auto item = json::parse(created.body());
    EXPECT_EQ(item["id"], 1);

    auto fetched = send_request(make_request(http::verb::get, "/api/items/1"));
    ASSERT_EQ(fetched.result(), http::status::ok);
    EXPECT_EQ(json::parse(fetched.body()), item);

    auto deleted = send_request(make_request(http::verb::delete_, "/api/items/1"));
    EXPECT_EQ(deleted.result(), http::status::no_content);

    auto missing = send_request(make_request(http::verb::get, "/api/items/1"));
    EXPECT_EQ(missing.result(), http::status::not_found);
}

TEST_F(ServerTest, ConcurrentCreatesOverSeparateConnections) {
    start(4);
    login();

    constexpr int CLIENTS = 16;
    std::vector<std::thread> clients;
    std::vector<std::uint64_t> ids(CLIENTS, 0);
    for (int i = 0; i < CLIENTS; ++i) {
        clients.emplace_back([this, i, &ids]() {
            auto res = send_request(make_request(http::verb::post, "/api/items",
                                                 R"({"name":"parallel","price":1})"));
            if (res.result() == http::status::created) {
                ids[i] = json::parse(res.body())["id"].get<std::uint64_t>();
            }
        });
    }
    for (auto& client : clients) {
        client.join();
    }

    std::set<std::uint64_t> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(CLIENTS));
    EXPECT_EQ(*unique.begin(), 1u);
    EXPECT_EQ(*unique.rbegin(), static_cast<std::uint64_t>(CLIENTS));
}

TEST_F(ServerTest, HeadResponseHasLengthButNoBody) {
    start();
    login();
    send_request(make_request(http::verb::post, "/api/items", R"({"name":"X","price":1})"));
    auto get = send_request(make_request(http::verb::get, "/api/items"));

    net::io_context io_context;
    tcp::socket socket(io_context);
    socket.connect(tcp::endpoint(net::ip::make_address(address_), port_));
    auto req = make_request(http::verb::head, "/api/items");
    req.set(http::field::host, address_);
    http::write(socket, req);

    // A HEAD response announces a body length it never sends
    beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    http::read(socket, buffer, parser);
    auto res = parser.release();

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_length], std::to_string(get.body().size()));
    EXPECT_EQ(res["X-Total-Items"], "1");

    boost::system::error_code ec;
    socket.close(ec);
}

TEST_F(ServerTest, OversizedBodyIsRejected) {
    start(1, 1024);

    net::io_context io_context;
    tcp::socket socket(io_context);
    socket.connect(tcp::endpoint(net::ip::make_address(address_), port_));

    // Headers only; the declared length alone exceeds the limit
    std::string head =
        "POST /api/items HTTP/1.1\r\n"
        "Host: " + address_ + "\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 4096\r\n"
        "\r\n";
    net::write(socket, net::buffer(head));

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);

    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_EQ(json::parse(res.body())["error"]["code"], "payload_too_large");

    boost::system::error_code ec;
    socket.close(ec);
}

TEST_F(ServerTest, OversizedBodyIsDrainedBeforeClose) {
    start(1, 1024);

    net::io_context io_context;
    tcp::socket socket(io_context);
    socket.connect(tcp::endpoint(net::ip::make_address(address_), port_));

    // The whole body goes out, well past the limit, before the answer is read
    std::string body(256 * 1024, 'x');
    std::string request =
        "POST /api/items HTTP/1.1\r\n"
        "Host: " + address_ + "\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;
    net::write(socket, net::buffer(request));
    socket.shutdown(tcp::socket::shutdown_send);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    boost::system::error_code ec;
    http::read(socket, buffer, res, ec);

    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_EQ(json::parse(res.body())["error"]["code"], "payload_too_large");

    socket.close(ec);

    // The server is still serving after the rejected upload
    EXPECT_EQ(send_request(make_request(http::verb::options, "/api/items")).result(),
              http::status::ok);
}

TEST_F(ServerTest, OptionsWithoutAuthorization) {
    start();

    auto res = send_request(make_request(http::verb::options, "/api/items"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::allow], "GET, POST, PUT, PATCH, DELETE, HEAD, OPTIONS, TRACE, CONNECT");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

TEST_F(ServerTest, XForwardedForIsRecordedAsClient) {
    start();
    login();

    auto req = make_request(http::verb::get, "/api/items");
    req.set("X-Forwarded-For", "203.0.113.7, 10.0.0.1");
    send_request(req);

    auto recent = context_->stats.recent();
    ASSERT_FALSE(recent.empty());
    EXPECT_EQ(recent.back().client_address, "203.0.113.7");
    EXPECT_EQ(recent.front().client_address, "127.0.0.1");
}
