#include "request_handler.hpp"
#include <stdexcept>

namespace imitatus {

RequestHandler::RequestHandler(std::shared_ptr<ServerContext> context)
    : context_(std::move(context)) {
    if (!context_ || !context_->store) {
        throw std::invalid_argument("RequestHandler requires a server context with a store");
    }
}

} // namespace imitatus
