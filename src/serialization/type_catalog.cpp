#include "stasis/serialization/type_catalog.hpp"

#include "stasis/log/logger.hpp"
#include "stasis/types/builtin_types.hpp"

namespace stasis::serialization {

TypeCatalog& TypeCatalog::instance() {
    static TypeCatalog catalog = [] {
        TypeCatalog builtin;
        types::register_builtin_types(builtin);
        return builtin;
    }();
    return catalog;
}

void TypeCatalog::add(std::type_index type,
                      std::shared_ptr<const Factory> factory) {
    const std::string name = factory->name();
    names_.insert_or_assign(type, name);
    types_.insert_or_assign(name, type);
    add_factory(std::move(factory));
}

void TypeCatalog::add_factory(std::shared_ptr<const Factory> factory) {
    STASIS_LOG_DEBUG << "Type catalog entry: " << factory->name();
    factories_.insert_or_assign(factory->name(), std::move(factory));
}

std::optional<std::string> TypeCatalog::name_of(std::type_index type) const {
    auto it = names_.find(type);
    if (it != names_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<std::type_index> TypeCatalog::type_of(
    const std::string& name) const {
    auto it = types_.find(name);
    if (it != types_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::shared_ptr<const Factory> TypeCatalog::factory(
    const std::string& name) const {
    auto it = factories_.find(name);
    return (it != factories_.end()) ? it->second : nullptr;
}

}  // namespace stasis::serialization
