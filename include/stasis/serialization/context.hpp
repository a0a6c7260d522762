#pragma once

#include <nlohmann/json.hpp>

#include "stasis/serialization/value.hpp"

namespace stasis::serialization {

/**
 * @brief The enclosing pickling/unpickling session seen by handlers
 *
 * Handlers hold a non-owning reference and must not outlive it. Both entry
 * points are re-entrant: a handler flattens nested values by calling back
 * into the context with reset = false.
 */
class Context {
public:
    virtual ~Context() = default;

    virtual nlohmann::json flatten(const Value& obj, bool reset = true) = 0;
    virtual Value restore(const nlohmann::json& obj, bool reset = true) = 0;

    // false selects lossy human-readable output without reconstruction data
    virtual bool unpicklable() const = 0;
};

}  // namespace stasis::serialization
