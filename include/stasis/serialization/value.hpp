#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

#include "stasis/serialization/exceptions.hpp"

namespace stasis::serialization {

class Object;
class Factory;

/**
 * @brief Runtime value exchanged between the session engine and handlers
 *
 * Holds one of: null, bool, 64-bit integer, double, string, raw bytes, a
 * list of values, a reference to a factory, or a polymorphic object.
 */
class Value {
public:
    using Bytes = std::vector<std::uint8_t>;
    using List = std::vector<Value>;
    using FactoryPtr = std::shared_ptr<const Factory>;
    using ObjectPtr = std::shared_ptr<const Object>;

    Value() : data_(nullptr) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool value) : data_(value) {}
    Value(int value) : data_(static_cast<std::int64_t>(value)) {}
    Value(std::int64_t value) : data_(value) {}
    Value(double value) : data_(value) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(Bytes value) : data_(std::move(value)) {}
    Value(List value) : data_(std::move(value)) {}
    Value(FactoryPtr factory);
    Value(ObjectPtr object);

    template <typename T>
        requires(!std::same_as<std::remove_cv_t<T>, Object> &&
                 std::is_convertible_v<T*, const Object*>)
    Value(std::shared_ptr<T> object) : Value(ObjectPtr(std::move(object))) {}

    bool is_null() const { return holds<std::nullptr_t>(); }
    bool is_bool() const { return holds<bool>(); }
    bool is_int() const { return holds<std::int64_t>(); }
    bool is_double() const { return holds<double>(); }
    bool is_string() const { return holds<std::string>(); }
    bool is_bytes() const { return holds<Bytes>(); }
    bool is_list() const { return holds<List>(); }
    bool is_factory() const { return holds<FactoryPtr>(); }
    bool is_object() const { return holds<ObjectPtr>(); }

    bool as_bool() const { return get<bool>("bool"); }
    std::int64_t as_int() const { return get<std::int64_t>("int"); }
    const std::string& as_string() const { return get<std::string>("string"); }
    const Bytes& as_bytes() const { return get<Bytes>("bytes"); }
    const List& as_list() const { return get<List>("list"); }
    const FactoryPtr& as_factory() const { return get<FactoryPtr>("factory"); }
    const ObjectPtr& as_object() const { return get<ObjectPtr>("object"); }

    // Integers widen to double
    double as_double() const;

    // Downcast the held object, throws TypeMismatch on any other content
    template <typename T>
    std::shared_ptr<const T> as() const {
        auto typed = std::dynamic_pointer_cast<const T>(as_object());
        if (!typed) {
            throw TypeMismatch("held object is not a " +
                               std::string(typeid(T).name()));
        }
        return typed;
    }

    // Name of the held alternative, for diagnostics
    std::string type_name() const;

    // Human-readable form, strings are rendered bare
    std::string str() const;

    // Like str() but strings are quoted, used for nested values
    std::string repr() const;

    bool operator==(const Value& other) const;

private:
    template <typename T>
    bool holds() const {
        return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T& get(const char* expected) const {
        if (const auto* value = std::get_if<T>(&data_)) {
            return *value;
        }
        throw TypeMismatch(std::string("expected ") + expected + ", got " +
                           type_name());
    }

    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string,
                 Bytes, List, FactoryPtr, ObjectPtr>
        data_;
};

}  // namespace stasis::serialization
