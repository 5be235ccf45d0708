#pragma once
#include "request_handler.hpp"

namespace imitatus {

// POST /api/login and POST /api/logout
class AuthHandler final : public RequestHandler {
public:
    explicit AuthHandler(std::shared_ptr<ServerContext> context)
        : RequestHandler(std::move(context)) {}

    void register_routes(Router& router) override;

private:
    Response login(RequestContext& ctx);
    Response logout(RequestContext& ctx);
};

} // namespace imitatus
