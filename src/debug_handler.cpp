#include "debug_handler.hpp"

namespace imitatus {

void DebugHandler::register_routes(Router& router) {
    add_route(router, http::verb::get, "/debug/vars", Access::Protected, &DebugHandler::vars);
}

Response DebugHandler::vars(RequestContext& ctx) {
    const auto& stats = context().stats;
    nlohmann::json body = {
        {"requests", stats.counts()},
        {"total_requests", stats.total()},
        {"uptime_seconds", stats.uptime_seconds()},
        {"active_tokens", context().sessions.size()},
        {"items_count", store().size()},
        {"recent_requests", stats.recent()}
    };
    return make_json_response(http::status::ok, body, ctx.request.version());
}

} // namespace imitatus
