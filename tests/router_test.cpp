#include <gtest/gtest.h>
#include "router.hpp"
#include "api_error.hpp"
#include "logging.hpp"
#include <boost/beast/http.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace imitatus;
namespace http = boost::beast::http;
using nlohmann::json;

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("info");
        context_ = std::make_shared<ServerContext>(std::make_shared<MemoryResourceStore>());
        router_ = std::make_shared<Router>(context_);

        router_->add_route(http::verb::get, "/public", Access::Public,
                           [](RequestContext& ctx) {
                               return make_json_response(http::status::ok, {{"path", ctx.path}},
                                                         ctx.request.version());
                           });
        router_->add_route(http::verb::get, "/things/{id}", Access::Protected,
                           [](RequestContext& ctx) {
                               return make_json_response(http::status::ok,
                                                         {{"id", ctx.item_id()}, {"user", ctx.user_id}},
                                                         ctx.request.version());
                           });
        router_->add_route(http::verb::delete_, "/things/{id}", Access::Protected,
                           [](RequestContext& ctx) {
                               return make_empty_response(http::status::no_content, ctx.request.version());
                           });
        router_->add_route(http::verb::head, "/public", Access::Public,
                           [](RequestContext& ctx) {
                               return make_json_response(http::status::ok, {{"path", ctx.path}},
                                                         ctx.request.version());
                           });
        router_->add_route(http::verb::post, "/boom", Access::Public,
                           [](RequestContext&) -> Response {
                               throw std::runtime_error("secret internal detail");
                           });
        router_->add_route(http::verb::connect, "*", Access::Public,
                           [](RequestContext& ctx) {
                               return make_json_response(http::status::ok, {{"endpoint", ctx.path}},
                                                         ctx.request.version());
                           });
    }

    http::request<http::string_body> make_request(http::verb method, const std::string& target,
                                                  const std::string& token = "") {
        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, "localhost");
        if (!token.empty()) {
            req.set(http::field::authorization, "Bearer " + token);
        }
        return req;
    }

    static std::string error_code(const Response& res) {
        return json::parse(res.body())["error"]["code"].get<std::string>();
    }

    std::shared_ptr<ServerContext> context_;
    std::shared_ptr<Router> router_;
};

TEST_F(RouterTest, RoutesExactPathAndIgnoresQueryString) {
    auto res = router_->handle_request(make_request(http::verb::get, "/public?x=1"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["path"], "/public");
    EXPECT_EQ(res[http::field::content_type], "application/json");
}

TEST_F(RouterTest, UnknownPathIsNotFound) {
    auto res = router_->handle_request(make_request(http::verb::get, "/nope"));
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(error_code(res), "not_found");

    res = router_->handle_request(make_request(http::verb::get, "/things/1/extra"));
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(RouterTest, WrongMethodIsNotAllowedWithAllowHeader) {
    auto res = router_->handle_request(make_request(http::verb::put, "/things/1"));
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "GET, DELETE");
    EXPECT_EQ(error_code(res), "method_not_allowed");
}

TEST_F(RouterTest, MethodNotAllowedTakesPrecedenceOverAuth) {
    // No token, but the method check happens first
    auto res = router_->handle_request(make_request(http::verb::post, "/things/1"));
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
}

TEST_F(RouterTest, ProtectedRouteRequiresToken) {
    auto res = router_->handle_request(make_request(http::verb::get, "/things/1"));
    EXPECT_EQ(res.result(), http::status::unauthorized);
    EXPECT_EQ(error_code(res), "missing_token");
    EXPECT_EQ(res[http::field::www_authenticate], "Bearer");

    res = router_->handle_request(make_request(http::verb::get, "/things/1", "bogus"));
    EXPECT_EQ(res.result(), http::status::unauthorized);
    EXPECT_EQ(error_code(res), "invalid_token");
}

TEST_F(RouterTest, ProtectedRouteReceivesPrincipalAndId) {
    auto token = context_->sessions.issue("user-42");
    auto res = router_->handle_request(make_request(http::verb::get, "/things/17", token));
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["id"], 17);
    EXPECT_EQ(body["user"], "user-42");
}

TEST_F(RouterTest, AuthIsCheckedBeforeIdValidation) {
    auto res = router_->handle_request(make_request(http::verb::get, "/things/abc"));
    EXPECT_EQ(res.result(), http::status::unauthorized);
}

TEST_F(RouterTest, InvalidIdIsBadRequest) {
    auto token = context_->sessions.issue("user");
    for (const std::string id : {"abc", "0", "-1", "1.5", "99999999999999999999999"}) {
        auto res = router_->handle_request(make_request(http::verb::get, "/things/" + id, token));
        EXPECT_EQ(res.result(), http::status::bad_request) << id;
        EXPECT_EQ(error_code(res), "invalid_id") << id;
    }

    // Empty trailing segment matches the pattern and is rejected as a bad id
    auto res = router_->handle_request(make_request(http::verb::get, "/things/", token));
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(RouterTest, UnexpectedExceptionsAreSanitized) {
    auto res = router_->handle_request(make_request(http::verb::post, "/boom"));
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(error_code(res), "internal_error");
    EXPECT_EQ(res.body().find("secret"), std::string::npos);
}

TEST_F(RouterTest, HeadKeepsContentLengthButDropsBody) {
    auto get = router_->handle_request(make_request(http::verb::get, "/public"));
    auto head = router_->handle_request(make_request(http::verb::head, "/public"));
    EXPECT_EQ(head.result(), http::status::ok);
    EXPECT_TRUE(head.body().empty());
    EXPECT_EQ(head[http::field::content_length], std::to_string(get.body().size()));
}

TEST_F(RouterTest, WildcardRouteMatchesAuthorityTargets) {
    auto res = router_->handle_request(make_request(http::verb::connect, "example.com:443"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["endpoint"], "example.com:443");

    // Wildcard routes are not advertised for concrete paths
    EXPECT_EQ(join_methods(router_->allowed_methods("/public")), "GET, HEAD");
}

TEST_F(RouterTest, EveryResponseCarriesStandardHeaders) {
    for (auto res : {router_->handle_request(make_request(http::verb::get, "/public")),
                     router_->handle_request(make_request(http::verb::get, "/nope"))}) {
        EXPECT_EQ(res[http::field::server], "Imitatus 0.1.0");
        EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
        EXPECT_EQ(res[http::field::access_control_allow_methods],
                  "GET, POST, PUT, PATCH, DELETE, HEAD, OPTIONS, TRACE, CONNECT");
        EXPECT_EQ(res[http::field::access_control_allow_headers],
                  "Content-Type, Authorization, X-Requested-With");
        EXPECT_FALSE(res.keep_alive());
    }
}

TEST_F(RouterTest, CountsEveryDispatchedRequest) {
    auto token = context_->sessions.issue("user");
    router_->handle_request(make_request(http::verb::get, "/things/1"));
    router_->handle_request(make_request(http::verb::get, "/things/2", token));
    router_->handle_request(make_request(http::verb::put, "/things/2", token));
    router_->handle_request(make_request(http::verb::get, "/nope"));
    router_->handle_request(make_request(http::verb::connect, "host:443"));

    auto counts = context_->stats.counts();
    EXPECT_EQ(counts["GET /things/{id}"], 2u);
    EXPECT_EQ(counts["PUT /things/{id}"], 1u);
    EXPECT_EQ(counts["GET (unmatched)"], 1u);
    EXPECT_EQ(counts["CONNECT *"], 1u);
    EXPECT_EQ(context_->stats.total(), 5u);

    auto recent = context_->stats.recent();
    ASSERT_EQ(recent.size(), 5u);
    EXPECT_EQ(recent.front().status, 401u);
    EXPECT_EQ(recent.back().method, "CONNECT");
}

TEST_F(RouterTest, PatternsKeepRegistrationOrder) {
    auto patterns = router_->patterns();
    ASSERT_EQ(patterns.size(), 3u);
    EXPECT_EQ(patterns[0], "/public");
    EXPECT_EQ(patterns[1], "/things/{id}");
    EXPECT_EQ(patterns[2], "/boom");
}

TEST(RequestStatsTest, KeepsOnlyMostRecentRecords) {
    RequestStats stats(2);
    for (unsigned status : {200u, 201u, 404u}) {
        RequestRecord record;
        record.method = "GET";
        record.path = "/x";
        record.status = status;
        stats.record(record);
    }
    auto recent = stats.recent();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].status, 201u);
    EXPECT_EQ(recent[1].status, 404u);
    EXPECT_GE(stats.uptime_seconds(), 0.0);
    EXPECT_EQ(stats.total(), 0u);
}
