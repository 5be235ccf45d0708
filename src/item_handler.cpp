#include "item_handler.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace imitatus {

void ItemHandler::register_routes(Router& router) {
    add_route(router, http::verb::get, "/api/items", Access::Protected, &ItemHandler::list_items);
    add_route(router, http::verb::head, "/api/items", Access::Protected, &ItemHandler::head_items);
    add_route(router, http::verb::post, "/api/items", Access::Protected, &ItemHandler::create_item);
    add_route(router, http::verb::get, "/api/items/{id}", Access::Protected, &ItemHandler::get_item);
    add_route(router, http::verb::put, "/api/items/{id}", Access::Protected, &ItemHandler::replace_item);
    add_route(router, http::verb::patch, "/api/items/{id}", Access::Protected, &ItemHandler::patch_item);
    add_route(router, http::verb::delete_, "/api/items/{id}", Access::Protected, &ItemHandler::delete_item);
}

Response ItemHandler::list_items(RequestContext& ctx) {
    nlohmann::json items = store().list();
    return make_json_response(http::status::ok, items, ctx.request.version());
}

Response ItemHandler::head_items(RequestContext& ctx) {
    // Same representation as GET; the router drops the body and keeps its length
    auto res = list_items(ctx);
    res.set("X-Total-Items", std::to_string(store().size()));
    res.set("X-Active-Tokens", std::to_string(context().sessions.size()));
    return res;
}

Response ItemHandler::create_item(RequestContext& ctx) {
    auto fields = ItemFields::from_json(ctx.json_body(), FieldMode::Full);
    Item item = store().create(fields);
    Logger::get().info("User {} created item {}", ctx.user_id, item.id);

    auto res = make_json_response(http::status::created, item, ctx.request.version());
    res.set(http::field::location, "/api/items/" + std::to_string(item.id));
    return res;
}

Response ItemHandler::get_item(RequestContext& ctx) {
    Item item = store().get(ctx.item_id());
    return make_json_response(http::status::ok, item, ctx.request.version());
}

Response ItemHandler::replace_item(RequestContext& ctx) {
    auto id = ctx.item_id();
    auto fields = ItemFields::from_json(ctx.json_body(), FieldMode::Full);
    Item item = store().replace(id, fields);
    return make_json_response(http::status::ok, item, ctx.request.version());
}

Response ItemHandler::patch_item(RequestContext& ctx) {
    auto id = ctx.item_id();
    auto fields = ItemFields::from_json(ctx.json_body(), FieldMode::Partial);
    Item item = store().patch(id, fields);
    return make_json_response(http::status::ok, item, ctx.request.version());
}

Response ItemHandler::delete_item(RequestContext& ctx) {
    store().remove(ctx.item_id());
    Logger::get().info("User {} deleted item {}", ctx.user_id, ctx.params["id"]);
    return make_empty_response(http::status::no_content, ctx.request.version());
}

} // namespace imitatus
