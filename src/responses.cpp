#include "responses.hpp"
#include "config.hpp"
#include <spdlog/fmt/fmt.h>

namespace imitatus {

namespace {

constexpr const char* JSON_CONTENT_TYPE = "application/json";
constexpr const char* ALLOWED_HEADERS = "Content-Type, Authorization, X-Requested-With";

nlohmann::json error_body(const std::string& code, const std::string& message) {
    return {{"error", {{"code", code}, {"message", message}}}};
}

} // namespace

const std::vector<http::verb>& supported_methods() {
    static const std::vector<http::verb> methods = {
        http::verb::get, http::verb::post, http::verb::put,
        http::verb::patch, http::verb::delete_, http::verb::head,
        http::verb::options, http::verb::trace, http::verb::connect
    };
    return methods;
}

std::string join_methods(const std::vector<http::verb>& methods) {
    std::string joined;
    for (auto method : methods) {
        if (!joined.empty()) joined += ", ";
        joined += std::string(http::to_string(method));
    }
    return joined;
}

Response make_json_response(http::status status, const nlohmann::json& body, unsigned version) {
    Response res{status, version};
    res.set(http::field::content_type, JSON_CONTENT_TYPE);
    // Paths and headers echoed into bodies may carry bytes that are not UTF-8
    res.body() = body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

Response make_empty_response(http::status status, unsigned version) {
    Response res{status, version};
    res.prepare_payload();
    return res;
}

Response make_error_response(const ApiError& error, unsigned version) {
    auto res = make_json_response(error.status(), error_body(error.code(), error.what()), version);
    if (auto* not_allowed = dynamic_cast<const MethodNotAllowedError*>(&error)) {
        res.set(http::field::allow, join_methods(not_allowed->allowed()));
    }
    if (error.status() == http::status::unauthorized) {
        res.set(http::field::www_authenticate, "Bearer");
    }
    return res;
}

Response make_internal_error_response(unsigned version) {
    return make_json_response(http::status::internal_server_error,
                              error_body("internal_error", "Internal server error"),
                              version);
}

void apply_standard_headers(Response& res) {
    res.set(http::field::server, fmt::format("{} {}", SERVER_NAME, VERSION));
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, join_methods(supported_methods()));
    res.set(http::field::access_control_allow_headers, ALLOWED_HEADERS);
}

} // namespace imitatus
