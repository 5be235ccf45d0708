#ifndef ITEM_HANDLER_HPP
#define ITEM_HANDLER_HPP
#include "request_handler.hpp"
#include <memory>
namespace imitatus {
// CRUD endpoints for /api/items and /api/items/{id}
class ItemHandler : public RequestHandler {
public:
    explicit ItemHandler(std::shared_ptr<ServerContext> context)
        : RequestHandler(std::move(context)) {}

    void register_routes(Router& router) override;
private:
    Response list_items(RequestContext& ctx);
    Response head_items(RequestContext& ctx);
    Response create_item(RequestContext& ctx);
    Response get_item(RequestContext& ctx);
    Response replace_item(RequestContext& ctx);
    Response patch_item(RequestContext& ctx);
    Response delete_item(RequestContext& ctx);
};
} // namespace imitatus
#endif // ITEM_HANDLER_HPP
