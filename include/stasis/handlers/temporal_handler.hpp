#pragma once

#include "stasis/handlers/reduce_handler.hpp"

namespace stasis::handlers {

/**
 * @brief Reduce handler for date/time values carrying a packed byte state
 *
 * Temporal types reduce to (factory, [state, rest...]) where state is their
 * canonical internal byte payload. The payload is written as base64 text so
 * it survives a text-only document; the remaining arguments are flattened
 * normally and keep their order. Restore rebuilds the value through the
 * factory's state constructor, without re-validating the fields.
 */
class TemporalHandler : public ReduceHandler {
public:
    using ReduceHandler::ReduceHandler;

    nlohmann::json flatten(const serialization::Value& obj,
                           nlohmann::json& data) override;
    serialization::Value restore(const nlohmann::json& obj) override;
};

}  // namespace stasis::handlers
