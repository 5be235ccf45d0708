#pragma once
#include <boost/beast/http.hpp>
#include <optional>
#include <string>
#include "session_registry.hpp"

namespace imitatus {
namespace http = boost::beast::http;

class AuthGate {
public:
    explicit AuthGate(const SessionRegistry& sessions) : sessions_(sessions) {}

    // Resolves the caller's principal from "Authorization: Bearer <token>".
    // Throws UnauthorizedError when the header is absent, uses another
    // scheme, or names an unknown token.
    std::string authenticate(const http::request<http::string_body>& req) const;

    // Token part of a well-formed bearer header, if any
    static std::optional<std::string> bearer_token(const http::request<http::string_body>& req);

private:
    const SessionRegistry& sessions_;
};

} // namespace imitatus
