#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "stasis/handlers/handler_registry.hpp"
#include "stasis/serialization/context.hpp"
#include "stasis/serialization/session_config.hpp"
#include "stasis/serialization/type_catalog.hpp"

namespace stasis::serialization {

/**
 * @brief Reference engine turning Values into JSON documents and back
 *
 * Primitives and lists are handled directly; objects are dispatched by exact
 * type through the handler registry. The session keeps no identity table
 * and does not detect cycles; nesting is bounded by SessionConfig::max_depth.
 */
class Session : public Context {
public:
    explicit Session(
        SessionConfig config = SessionConfig{},
        handlers::HandlerRegistry& registry = handlers::HandlerRegistry::instance(),
        TypeCatalog& catalog = TypeCatalog::instance());

    nlohmann::json flatten(const Value& obj, bool reset = true) override;
    Value restore(const nlohmann::json& obj, bool reset = true) override;
    bool unpicklable() const override { return config_.unpicklable; }

    // JSON text wrappers around flatten/restore
    std::string encode(const Value& obj);
    Value decode(const std::string& text);

    const SessionConfig& config() const { return config_; }

private:
    class DepthGuard;

    nlohmann::json flatten_object(const Value::ObjectPtr& obj);
    Value restore_tagged(const nlohmann::json& obj);
    Value restore_object(const nlohmann::json& obj);

    SessionConfig config_;
    handlers::HandlerRegistry& registry_;
    TypeCatalog& catalog_;
    int depth_ = 0;
};

std::string encode(const Value& obj, bool unpicklable = true);
Value decode(const std::string& text);

}  // namespace stasis::serialization
