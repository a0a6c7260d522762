#include "stasis/handlers/handler_registry.hpp"

#include "stasis/handlers/builtin_handlers.hpp"
#include "stasis/log/logger.hpp"

namespace stasis::handlers {

HandlerRegistry& HandlerRegistry::instance() {
    static HandlerRegistry registry = [] {
        HandlerRegistry builtin;
        register_builtin_handlers(builtin);
        return builtin;
    }();
    return registry;
}

void HandlerRegistry::register_handler(std::type_index type,
                                       HandlerFactory factory) {
    auto [it, inserted] = handlers_.insert_or_assign(type, std::move(factory));
    if (inserted) {
        STASIS_LOG_DEBUG << "Handler registered for " << type.name();
    } else {
        STASIS_LOG_INFO << "Handler for " << type.name() << " replaced";
    }
}

std::optional<HandlerFactory> HandlerRegistry::lookup(
    std::type_index type) const {
    auto it = handlers_.find(type);
    if (it != handlers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace stasis::handlers
