#include "router.hpp"
#include "api_error.hpp"
#include "auth_gate.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace imitatus {

std::uint64_t RequestContext::item_id() const {
    auto it = params.find("id");
    if (it == params.end() || it->second.empty()) {
        throw ValidationError("invalid_id", "Missing item id");
    }
    const std::string& raw = it->second;
    bool all_digits = std::all_of(raw.begin(), raw.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!all_digits) {
        throw ValidationError("invalid_id", "Item id must be a positive integer");
    }
    std::uint64_t id = 0;
    try {
        id = std::stoull(raw);
    } catch (const std::out_of_range&) {
        throw ValidationError("invalid_id", "Item id is out of range");
    }
    if (id == 0) {
        throw ValidationError("invalid_id", "Item id must be a positive integer");
    }
    return id;
}

nlohmann::json RequestContext::json_body() const {
    const std::string& body = request.body();
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::get().debug("Rejecting malformed JSON body: {}", e.what());
        throw ValidationError("invalid_json", "Invalid JSON format");
    }
}

Router::Router(std::shared_ptr<ServerContext> context)
    : context_(std::move(context)) {}

std::string Router::path_of(const std::string& target) {
    auto end = target.find_first_of("?#");
    return end == std::string::npos ? target : target.substr(0, end);
}

std::vector<std::string> Router::split_path(const std::string& path) {
    std::vector<std::string> segments;
    if (path.empty() || path.front() != '/') {
        return segments;
    }
    std::stringstream ss(path.substr(1));
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        segments.push_back(segment);
    }
    // getline drops a trailing empty segment ("/api/items/")
    if (path.size() > 1 && path.back() == '/') {
        segments.emplace_back();
    }
    if (segments.empty()) {
        segments.emplace_back();
    }
    return segments;
}

void Router::add_route(http::verb method, const std::string& pattern, Access access, RouteHandler handler) {
    Route route{access, std::move(handler)};

    if (pattern == "*") {
        any_target_routes_[method] = std::move(route);
        return;
    }

    auto it = std::find_if(routes_.begin(), routes_.end(),
                           [&](const PathRoute& r) { return r.pattern == pattern; });
    if (it == routes_.end()) {
        routes_.push_back(PathRoute{pattern, split_path(pattern), {}});
        it = std::prev(routes_.end());
    }
    it->methods[method] = std::move(route);
}

const Router::PathRoute* Router::match(const std::string& path,
                                       std::map<std::string, std::string>& params) const {
    auto segments = split_path(path);
    if (segments.empty()) {
        return nullptr;
    }

    for (const auto& route : routes_) {
        if (route.segments.size() != segments.size()) {
            continue;
        }
        std::map<std::string, std::string> captured;
        bool matched = true;
        for (size_t i = 0; i < segments.size(); ++i) {
            const std::string& expected = route.segments[i];
            if (expected.size() > 2 && expected.front() == '{' && expected.back() == '}') {
                captured[expected.substr(1, expected.size() - 2)] = segments[i];
            } else if (expected != segments[i]) {
                matched = false;
                break;
            }
        }
        if (matched) {
            params = std::move(captured);
            return &route;
        }
    }
    return nullptr;
}

std::vector<http::verb> Router::allowed_methods(const std::string& path) const {
    std::map<std::string, std::string> params;
    const PathRoute* route = match(path_of(path), params);
    std::vector<http::verb> allowed;
    if (!route) {
        return allowed;
    }
    for (auto method : supported_methods()) {
        if (route->methods.count(method) > 0) {
            allowed.push_back(method);
        }
    }
    return allowed;
}

std::vector<std::string> Router::patterns() const {
    std::vector<std::string> result;
    for (const auto& route : routes_) {
        result.push_back(route.pattern);
    }
    return result;
}

Response Router::dispatch(RequestContext& ctx, const Route& route) {
    if (route.access == Access::Protected) {
        ctx.user_id = AuthGate(context_->sessions).authenticate(ctx.request);
    }
    return route.handler(ctx);
}

Response Router::handle_request(const http::request<http::string_body>& req,
                                const std::string& client_address) {
    std::string target(req.target());
    std::string method(req.method_string());
    RequestContext ctx{req, *context_, path_of(target), "", {}, client_address, ""};

    Response res;
    try {
        auto any_it = any_target_routes_.find(req.method());
        if (any_it != any_target_routes_.end()) {
            ctx.pattern = "*";
            ctx.path = target;
            context_->stats.count(method + " *");
            res = dispatch(ctx, any_it->second);
        } else {
            const PathRoute* route = match(ctx.path, ctx.params);
            if (!route) {
                context_->stats.count(method + " (unmatched)");
                throw NotFoundError("Endpoint not found");
            }
            ctx.pattern = route->pattern;
            context_->stats.count(method + " " + route->pattern);

            auto method_it = route->methods.find(req.method());
            if (method_it == route->methods.end()) {
                throw MethodNotAllowedError(allowed_methods(ctx.path));
            }
            res = dispatch(ctx, method_it->second);
        }
    } catch (const ApiError& e) {
        Logger::get().debug("{} {} failed: {} ({})", method, target, e.code(), e.what());
        res = make_error_response(e, req.version());
    } catch (const std::exception& e) {
        Logger::get().error("Unhandled error for {} {}: {}", method, target, e.what());
        res = make_internal_error_response(req.version());
    }

    // HEAD answers carry the length of the body they would have had
    if (req.method() == http::verb::head && !res.body().empty()) {
        auto length = res.body().size();
        res.body().clear();
        res.content_length(length);
    }

    apply_standard_headers(res);
    res.keep_alive(false);

    RequestRecord record;
    record.timestamp = to_unix_seconds(std::chrono::system_clock::now());
    record.method = method;
    record.path = target;
    record.status = res.result_int();
    record.client_address = client_address;
    context_->stats.record(std::move(record));

    Logger::get().info("{} \"{} {}\" {}", client_address.empty() ? "-" : client_address,
                       method, target, res.result_int());
    return res;
}

} // namespace imitatus
