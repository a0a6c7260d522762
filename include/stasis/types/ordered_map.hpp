#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "stasis/serialization/object.hpp"

namespace stasis::types {

/**
 * @brief Mapping that remembers insertion order
 *
 * Keys are compared with Value equality. Reassigning an existing key keeps
 * its original position. Two maps are equal only if their items match in
 * order. Reduces to (OrderedMap, []) when empty and to
 * (OrderedMap, [[[key, value], ...]]) otherwise.
 */
class OrderedMap : public serialization::Reconstructible {
public:
    using Item = std::pair<serialization::Value, serialization::Value>;

    OrderedMap() = default;
    OrderedMap(std::initializer_list<Item> items);

    void set(serialization::Value key, serialization::Value value);
    bool erase(const serialization::Value& key);

    // nullptr when the key is absent
    const serialization::Value* find(const serialization::Value& key) const;

    bool contains(const serialization::Value& key) const {
        return find(key) != nullptr;
    }
    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<Item>& items() const { return items_; }

    serialization::Reduction reduce() const override;
    std::string str() const override;
    bool equals(const serialization::Object& other) const override;

    static const std::shared_ptr<const serialization::Factory>& factory();

private:
    std::vector<Item> items_;
};

}  // namespace stasis::types
