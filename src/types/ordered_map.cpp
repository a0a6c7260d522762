#include "stasis/types/ordered_map.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "arguments.hpp"

namespace stasis::types {

using serialization::Value;

OrderedMap::OrderedMap(std::initializer_list<Item> items) {
    for (const auto &[key, value] : items) {
        set(key, value);
    }
}

void OrderedMap::set(Value key, Value value) {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [&key](const Item& item) { return item.first == key; });
    if (it != items_.end()) {
        it->second = std::move(value);
        return;
    }
    items_.emplace_back(std::move(key), std::move(value));
}

bool OrderedMap::erase(const Value& key) {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [&key](const Item& item) { return item.first == key; });
    if (it == items_.end()) {
        return false;
    }
    items_.erase(it);
    return true;
}

const Value* OrderedMap::find(const Value& key) const {
    for (const auto& item : items_) {
        if (item.first == key) {
            return &item.second;
        }
    }
    return nullptr;
}

serialization::Reduction OrderedMap::reduce() const {
    if (items_.empty()) {
        return {factory(), {}};
    }

    Value::List pairs;
    pairs.reserve(items_.size());
    for (const auto &[key, value] : items_) {
        pairs.emplace_back(Value::List{key, value});
    }
    return {factory(), {Value(std::move(pairs))}};
}

std::string OrderedMap::str() const {
    std::ostringstream oss;
    oss << "OrderedMap([";
    for (std::size_t i = 0; i < items_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << '(' << items_[i].first.repr() << ", " << items_[i].second.repr()
            << ')';
    }
    oss << "])";
    return oss.str();
}

bool OrderedMap::equals(const serialization::Object& other) const {
    const auto* map = dynamic_cast<const OrderedMap*>(&other);
    return map != nullptr && typeid(*map) == typeid(*this) &&
           map->items_ == items_;
}

const std::shared_ptr<const serialization::Factory>& OrderedMap::factory() {
    static const auto instance = serialization::make_factory(
        "stasis.OrderedMap", [](const Value::List& args) -> Value {
            detail::check_arity(args, 0, 1, "stasis.OrderedMap");
            auto map = std::make_shared<OrderedMap>();
            if (args.empty()) {
                return map;
            }
            for (const auto& pair : args[0].as_list()) {
                const auto& entry = pair.as_list();
                if (entry.size() != 2) {
                    throw std::invalid_argument(
                        "stasis.OrderedMap items must be [key, value] pairs");
                }
                map->set(entry[0], entry[1]);
            }
            return map;
        });
    return instance;
}

}  // namespace stasis::types
