#include "auth_gate.hpp"
#include "api_error.hpp"
#include "logging.hpp"
#include <boost/beast/core/string.hpp>

namespace imitatus {

namespace {

constexpr std::size_t SCHEME_LENGTH = 7; // "Bearer "

bool has_bearer_scheme(boost::beast::string_view header) {
    return header.size() > SCHEME_LENGTH &&
           boost::beast::iequals(header.substr(0, SCHEME_LENGTH), "Bearer ");
}

} // namespace

std::optional<std::string> AuthGate::bearer_token(const http::request<http::string_body>& req) {
    auto auth_it = req.find(http::field::authorization);
    if (auth_it == req.end() || !has_bearer_scheme(auth_it->value())) {
        return std::nullopt;
    }
    std::string token(auth_it->value().substr(SCHEME_LENGTH));
    token.erase(0, token.find_first_not_of(' '));
    token.erase(token.find_last_not_of(' ') + 1);
    if (token.empty() || token.find(' ') != std::string::npos) {
        return std::nullopt;
    }
    return token;
}

std::string AuthGate::authenticate(const http::request<http::string_body>& req) const {
    auto auth_it = req.find(http::field::authorization);
    if (auth_it == req.end() || auth_it->value().empty()) {
        Logger::get().debug("No Authorization header found");
        throw UnauthorizedError("missing_token", "No token provided");
    }

    auto token = bearer_token(req);
    if (!token) {
        Logger::get().debug("Authorization header is not a Bearer token");
        throw UnauthorizedError("malformed_authorization",
                                "Authorization header must use the Bearer scheme");
    }

    std::string user_id = sessions_.validate(*token);
    Logger::get().debug("Bearer token authentication successful for user {}", user_id);
    return user_id;
}

} // namespace imitatus
