#pragma once
#include "request_handler.hpp"

namespace imitatus {

// GET /debug/vars: runtime counters for test harnesses
class DebugHandler final : public RequestHandler {
public:
    explicit DebugHandler(std::shared_ptr<ServerContext> context)
        : RequestHandler(std::move(context)) {}

    void register_routes(Router& router) override;

private:
    Response vars(RequestContext& ctx);
};

} // namespace imitatus
