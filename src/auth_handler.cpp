#include "auth_handler.hpp"
#include "api_error.hpp"
#include "auth_gate.hpp"
#include "logging.hpp"

namespace imitatus {

void AuthHandler::register_routes(Router& router) {
    add_route(router, http::verb::post, "/api/login", Access::Public, &AuthHandler::login);
    add_route(router, http::verb::post, "/api/logout", Access::Protected, &AuthHandler::logout);
}

Response AuthHandler::login(RequestContext& ctx) {
    auto body = ctx.json_body();
    if (!body.is_object()) {
        throw ValidationError("invalid_body", "Invalid login format - expected object");
    }
    if (!body.contains("username") || !body.contains("password")) {
        throw ValidationError("missing_field", "Missing required fields: username and password");
    }
    if (!body["username"].is_string() || !body["password"].is_string()) {
        throw ValidationError("invalid_field", "Fields 'username' and 'password' must be strings");
    }

    const auto& credentials = context().credentials;
    if (body["username"].get<std::string>() != credentials.username ||
        body["password"].get<std::string>() != credentials.password) {
        Logger::get().info("Rejected login for user '{}'", body["username"].get<std::string>());
        throw UnauthorizedError("invalid_credentials", "Invalid credentials");
    }

    std::string user_id = generate_uuid();
    std::string token = context().sessions.issue(user_id);
    Logger::get().info("Login successful for '{}' (user_id {})", credentials.username, user_id);

    return make_json_response(http::status::ok, {
        {"token", token},
        {"user_id", user_id},
        {"message", "Login successful"}
    }, ctx.request.version());
}

Response AuthHandler::logout(RequestContext& ctx) {
    // The auth gate has already validated the token
    auto token = AuthGate::bearer_token(ctx.request);
    if (token) {
        context().sessions.revoke(*token);
    }
    Logger::get().info("Logged out user {}", ctx.user_id);
    return make_empty_response(http::status::no_content, ctx.request.version());
}

} // namespace imitatus
