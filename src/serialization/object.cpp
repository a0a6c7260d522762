#include "stasis/serialization/object.hpp"

#include "stasis/log/logger.hpp"

namespace stasis::serialization {

Factory::Factory(std::string name, Constructor constructor,
                 StateConstructor state_constructor)
    : name_(std::move(name)),
      constructor_(std::move(constructor)),
      state_constructor_(std::move(state_constructor)) {}

Value Factory::operator()(const Value::List& args) const {
    return constructor_(args);
}

Value Factory::from_state(const Value::Bytes& state,
                          const Value::List& rest) const {
    if (!state_constructor_) {
        STASIS_LOG_ERROR << "Factory " << name_
                         << " cannot be built from a raw state payload";
        throw ContractViolation("factory " + name_ +
                                " has no state constructor");
    }
    return state_constructor_(state, rest);
}

std::shared_ptr<const Factory> make_factory(
    std::string name, Factory::Constructor constructor,
    Factory::StateConstructor state_constructor) {
    return std::make_shared<const Factory>(std::move(name),
                                           std::move(constructor),
                                           std::move(state_constructor));
}

}  // namespace stasis::serialization
