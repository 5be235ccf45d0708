#include "diagnostics_handler.hpp"
#include "api_error.hpp"
#include "config.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <string>

namespace imitatus {

namespace {

// Max-Forwards is echoed one lower; this server is always the last hop.
std::string decrement_max_forwards(const std::string& value) {
    try {
        std::size_t consumed = 0;
        long hops = std::stol(value, &consumed);
        if (consumed != value.size() || hops < 0) {
            return value;
        }
        return std::to_string(std::max(0L, hops - 1));
    } catch (const std::exception&) {
        return value;
    }
}

} // namespace

void DiagnosticsHandler::register_routes(Router& router) {
    router_ = &router;
    for (const auto& pattern : router.patterns()) {
        add_route(router, http::verb::options, pattern, Access::Public, &DiagnosticsHandler::options);
    }
    add_route(router, http::verb::trace, "/api/items", Access::Protected, &DiagnosticsHandler::trace);
    add_route(router, http::verb::connect, "*", Access::Protected, &DiagnosticsHandler::connect);
}

Response DiagnosticsHandler::options(RequestContext& ctx) {
    // Capability discovery advertises the server's full verb set; the
    // per-path list is reserved for 405 answers
    const auto& allowed = supported_methods();

    nlohmann::json methods = nlohmann::json::array();
    for (auto method : allowed) {
        methods.push_back(std::string(http::to_string(method)));
    }

    nlohmann::json body = {
        {"path", ctx.path},
        {"available_endpoints", router_->patterns()},
        {"supported_methods", methods}
    };

    auto res = make_json_response(http::status::ok, body, ctx.request.version());
    res.set(http::field::allow, join_methods(allowed));
    res.set("X-API-Version", API_VERSION);
    res.set("X-Server-Time", std::to_string(to_unix_seconds(std::chrono::system_clock::now())));
    return res;
}

Response DiagnosticsHandler::trace(RequestContext& ctx) {
    const auto& req = ctx.request;

    std::string message;
    message += std::string(req.method_string()) + " " + std::string(req.target()) + " HTTP/" +
               std::to_string(req.version() / 10) + "." + std::to_string(req.version() % 10) + "\r\n";
    for (const auto& header : req) {
        std::string value(header.value());
        if (header.name() == http::field::max_forwards) {
            value = decrement_max_forwards(value);
        }
        message += std::string(header.name_string()) + ": " + value + "\r\n";
    }
    message += "\r\n";

    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, "message/http");
    res.body() = std::move(message);
    res.prepare_payload();
    return res;
}

Response DiagnosticsHandler::connect(RequestContext& ctx) {
    const std::string& endpoint = ctx.path;
    const std::string https_port = ":443";
    bool is_https = endpoint.size() > https_port.size() &&
                    endpoint.compare(endpoint.size() - https_port.size(), https_port.size(), https_port) == 0;
    if (!is_https) {
        throw ValidationError("unsupported_target",
                              "CONNECT is only acknowledged for port 443; tunneling is not supported");
    }

    Logger::get().info("Acknowledged CONNECT to {} without opening a tunnel", endpoint);
    return make_json_response(http::status::ok, {
        {"message", "CONNECT acknowledged; tunneling is not supported"},
        {"endpoint", endpoint},
        {"tunnel", false}
    }, ctx.request.version());
}

} // namespace imitatus
