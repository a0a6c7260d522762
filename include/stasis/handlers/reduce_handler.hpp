#pragma once

#include "stasis/handlers/handler.hpp"
#include "stasis/serialization/object.hpp"

namespace stasis::handlers {

/**
 * @brief Follows the reduce protocol to flatten any Reconstructible
 *
 * As long as the factory and its arguments can themselves be flattened, this
 * handles any object that implements reduce(). The document carries
 * "__reduce__": [factory, [args...]] and restore calls factory(args).
 */
class ReduceHandler : public BaseHandler {
public:
    using BaseHandler::BaseHandler;

    nlohmann::json flatten(const serialization::Value& obj,
                           nlohmann::json& data) override;
    serialization::Value restore(const nlohmann::json& obj) override;

protected:
    // The held object's reduction, ContractViolation if it has none
    serialization::Reduction reduction_of(const serialization::Value& obj) const;

    // The two-element reconstruction marker of a flattened document
    const nlohmann::json& reduce_marker(const nlohmann::json& obj) const;

    // Restore the encoded factory, which must yield a factory reference
    serialization::Value::FactoryPtr restore_factory(
        const nlohmann::json& encoded);
};

}  // namespace stasis::handlers
