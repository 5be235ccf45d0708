#include "routes.hpp"
#include "auth_handler.hpp"
#include "debug_handler.hpp"
#include "diagnostics_handler.hpp"
#include "item_handler.hpp"

namespace imitatus {

std::shared_ptr<Router> build_router(std::shared_ptr<ServerContext> context) {
    auto router = std::make_shared<Router>(context);

    std::make_shared<AuthHandler>(context)->register_routes(*router);
    std::make_shared<ItemHandler>(context)->register_routes(*router);
    std::make_shared<DebugHandler>(context)->register_routes(*router);
    // Must come last: OPTIONS is added for every path registered so far
    std::make_shared<DiagnosticsHandler>(context)->register_routes(*router);

    return router;
}

} // namespace imitatus
