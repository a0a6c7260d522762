#pragma once

#include <optional>
#include <typeindex>
#include <unordered_map>

#include "stasis/handlers/handler.hpp"

namespace stasis::handlers {

/**
 * @brief Exact-type mapping from runtime type to handler factory
 *
 * Lookups never consult base classes: a handler bound to T does not apply to
 * a subclass of T. A later registration for the same type replaces the
 * earlier one.
 *
 * Not synchronized. Callers must finish registering before serialization
 * traffic starts; register_handler racing with lookup is undefined.
 */
class HandlerRegistry {
public:
    // Process-wide registry, holds the default bindings from first use
    static HandlerRegistry& instance();

    void register_handler(std::type_index type, HandlerFactory factory);

    template <typename T, typename Handler>
    void register_handler() {
        register_handler(std::type_index(typeid(T)),
                         make_handler_factory<Handler>());
    }

    // std::nullopt tells the engine to fall back to generic handling
    std::optional<HandlerFactory> lookup(std::type_index type) const;

    template <typename T>
    std::optional<HandlerFactory> lookup() const {
        return lookup(std::type_index(typeid(T)));
    }

    bool contains(std::type_index type) const {
        return handlers_.find(type) != handlers_.end();
    }

    std::size_t size() const { return handlers_.size(); }

private:
    std::unordered_map<std::type_index, HandlerFactory> handlers_;
};

}  // namespace stasis::handlers

#define STASIS_CONCAT_IMPL(a, b) a##b
#define STASIS_CONCAT(a, b) STASIS_CONCAT_IMPL(a, b)

// Bind Handler to Type in the process-wide registry at static initialization
#define STASIS_REGISTER_HANDLER(Type, Handler)                          \
    namespace {                                                         \
    [[maybe_unused]] const auto STASIS_CONCAT(stasis_handler_, __LINE__) = \
        [] {                                                            \
            ::stasis::handlers::HandlerRegistry::instance()             \
                .register_handler<Type, Handler>();                     \
            return 0;                                                   \
        }();                                                            \
    }
