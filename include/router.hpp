#pragma once
#include <boost/beast/http.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "responses.hpp"
#include "server_context.hpp"

namespace imitatus {
namespace http = boost::beast::http;

enum class Access { Public, Protected };

// Everything a route handler sees for one request
struct RequestContext {
    const http::request<http::string_body>& request;
    ServerContext& server;
    std::string path;
    std::string pattern;
    std::map<std::string, std::string> params;
    std::string client_address;
    // Principal resolved by the auth gate; empty on public routes
    std::string user_id;

    // The {id} path parameter as a positive integer; throws ValidationError
    std::uint64_t item_id() const;

    // Parsed body; an empty body reads as an empty object. Throws
    // ValidationError on malformed JSON.
    nlohmann::json json_body() const;
};

using RouteHandler = std::function<Response(RequestContext&)>;

// Routing table of (method, path pattern) -> handler, built once at startup.
// Patterns are literal paths with optional "{name}" segments. A route added
// under "*" matches any request-target for its method (CONNECT uses
// authority-form targets) and is not listed in Allow.
class Router {
public:
    explicit Router(std::shared_ptr<ServerContext> context);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    void add_route(http::verb method, const std::string& pattern, Access access, RouteHandler handler);

    Response handle_request(const http::request<http::string_body>& req,
                            const std::string& client_address = "");

    // Methods routed for a concrete path, in advertised order; empty when
    // no pattern matches
    std::vector<http::verb> allowed_methods(const std::string& path) const;

    // Path patterns in registration order
    std::vector<std::string> patterns() const;

    ServerContext& context() { return *context_; }

    // Path component of a request-target (query and fragment removed)
    static std::string path_of(const std::string& target);

private:
    struct Route {
        Access access;
        RouteHandler handler;
    };

    struct PathRoute {
        std::string pattern;
        std::vector<std::string> segments;
        std::map<http::verb, Route> methods;
    };

    static std::vector<std::string> split_path(const std::string& path);
    const PathRoute* match(const std::string& path, std::map<std::string, std::string>& params) const;
    Response dispatch(RequestContext& ctx, const Route& route);

    std::shared_ptr<ServerContext> context_;
    std::vector<PathRoute> routes_;
    std::map<http::verb, Route> any_target_routes_;
};

} // namespace imitatus
