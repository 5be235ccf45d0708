#pragma once
#include "request_handler.hpp"

namespace imitatus {

// Protocol-level verbs: OPTIONS capability discovery, TRACE loop-back and
// CONNECT acknowledgement. Register this handler last so that OPTIONS is
// routed for every path the other handlers added.
class DiagnosticsHandler final : public RequestHandler {
public:
    explicit DiagnosticsHandler(std::shared_ptr<ServerContext> context)
        : RequestHandler(std::move(context)) {}

    void register_routes(Router& router) override;

private:
    Response options(RequestContext& ctx);
    Response trace(RequestContext& ctx);
    Response connect(RequestContext& ctx);

    // Router this handler was registered with; lists the available endpoints
    Router* router_ = nullptr;
};

} // namespace imitatus
