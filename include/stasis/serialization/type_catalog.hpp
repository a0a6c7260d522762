#pragma once

#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>

#include "stasis/serialization/object.hpp"

namespace stasis::serialization {

/**
 * @brief Stable names for object types and the factories that rebuild them
 *
 * The session engine writes these names into documents and resolves them on
 * restore. Like the handler registry it is populated before serialization
 * starts and is not synchronized.
 */
class TypeCatalog {
public:
    // Process-wide catalog, holds the built-in types from first use
    static TypeCatalog& instance();

    // Name T after its factory and make the factory resolvable
    template <typename T>
    void add(std::shared_ptr<const Factory> factory) {
        add(std::type_index(typeid(T)), std::move(factory));
    }

    void add(std::type_index type, std::shared_ptr<const Factory> factory);

    // Factory reachable by name only, for plain callables
    void add_factory(std::shared_ptr<const Factory> factory);

    std::optional<std::string> name_of(std::type_index type) const;
    std::optional<std::type_index> type_of(const std::string& name) const;

    // nullptr when the name is unknown
    std::shared_ptr<const Factory> factory(const std::string& name) const;

private:
    std::unordered_map<std::type_index, std::string> names_;
    std::unordered_map<std::string, std::type_index> types_;
    std::unordered_map<std::string, std::shared_ptr<const Factory>> factories_;
};

}  // namespace stasis::serialization
