#pragma once
#include <memory>
#include <string>
#include "config.hpp"
#include "request_stats.hpp"
#include "resource_store.hpp"
#include "session_registry.hpp"

namespace imitatus {

struct Credentials {
    std::string username = "admin";
    std::string password = "password";
};

// All mutable state of a running server. Built once at startup and shared by
// the router and every handler; tests build a fresh one per case.
struct ServerContext {
    explicit ServerContext(std::shared_ptr<ResourceStore> store,
                           Credentials credentials = {},
                           std::size_t recent_request_limit = 5)
        : store(std::move(store)),
          credentials(std::move(credentials)),
          stats(recent_request_limit) {}

    static std::shared_ptr<ServerContext> from_config(const Config& config) {
        return std::make_shared<ServerContext>(
            std::make_shared<MemoryResourceStore>(),
            Credentials{config.username(), config.password()},
            config.recent_request_limit());
    }

    std::shared_ptr<ResourceStore> store;
    Credentials credentials;
    SessionRegistry sessions;
    RequestStats stats;
};

} // namespace imitatus
