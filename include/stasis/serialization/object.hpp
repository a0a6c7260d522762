#pragma once

#include <functional>
#include <memory>
#include <string>

#include "stasis/serialization/value.hpp"

namespace stasis::serialization {

// Base class for every non-primitive runtime value
class Object {
public:
    virtual ~Object() = default;

    // Human-readable form, used when the session is not unpicklable
    virtual std::string str() const = 0;

    // Observable-state equality, false for objects of another type
    virtual bool equals(const Object& other) const = 0;
};

// A factory and the ordered arguments that rebuild a value: factory(*arguments)
struct Reduction {
    Value::FactoryPtr factory;
    Value::List arguments;
};

/**
 * @brief Object that can decompose itself into a Reduction
 *
 * Implement reduce() and bind the type to handlers::ReduceHandler to get
 * JSON round-tripping without a dedicated handler.
 */
class Reconstructible : public Object {
public:
    virtual Reduction reduce() const = 0;
};

/**
 * @brief Named callable that rebuilds values of one type
 *
 * The constructor validates its arguments like any public constructor. The
 * optional state constructor builds the value directly from a canonical byte
 * payload previously produced by reduce(), and performs no validation: it
 * only accepts payloads that came out of a serialized document.
 */
class Factory {
public:
    using Constructor = std::function<Value(const Value::List& args)>;
    using StateConstructor =
        std::function<Value(const Value::Bytes& state, const Value::List& rest)>;

    Factory(std::string name, Constructor constructor,
            StateConstructor state_constructor = nullptr);

    const std::string& name() const { return name_; }
    bool has_state_constructor() const {
        return static_cast<bool>(state_constructor_);
    }

    Value operator()(const Value::List& args) const;

    // Throws ContractViolation when the factory has no state constructor
    Value from_state(const Value::Bytes& state, const Value::List& rest) const;

private:
    std::string name_;
    Constructor constructor_;
    StateConstructor state_constructor_;
};

// Convenience for building shared factories
std::shared_ptr<const Factory> make_factory(
    std::string name, Factory::Constructor constructor,
    Factory::StateConstructor state_constructor = nullptr);

}  // namespace stasis::serialization
