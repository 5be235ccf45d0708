#pragma once
#include <memory>
#include "router.hpp"
#include "server_context.hpp"

namespace imitatus {

// Builds the complete routing table for the mock API
std::shared_ptr<Router> build_router(std::shared_ptr<ServerContext> context);

} // namespace imitatus
