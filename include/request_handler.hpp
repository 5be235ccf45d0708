#pragma once
#include <boost/beast/http.hpp>
#include <memory>
#include <string>
#include "router.hpp"
#include "server_context.hpp"

namespace imitatus {
namespace http = boost::beast::http;

// A group of related endpoints. Each handler registers its routes with the
// router; the registered callbacks keep the handler alive.
class RequestHandler : public std::enable_shared_from_this<RequestHandler> {
public:
    virtual ~RequestHandler() = default;

    explicit RequestHandler(std::shared_ptr<ServerContext> context);

    // Add this handler's routes to the routing table
    virtual void register_routes(Router& router) = 0;

protected:
    // Registers a member function of the concrete handler as a route
    template<typename Handler>
    void add_route(Router& router, http::verb method, const std::string& pattern,
                   Access access, Response (Handler::*member)(RequestContext&)) {
        auto self = std::static_pointer_cast<Handler>(shared_from_this());
        router.add_route(method, pattern, access,
                         [self, member](RequestContext& ctx) { return ((*self).*member)(ctx); });
    }

    ServerContext& context() { return *context_; }
    ResourceStore& store() { return *context_->store; }

    std::shared_ptr<ServerContext> context_;
};

} // namespace imitatus
