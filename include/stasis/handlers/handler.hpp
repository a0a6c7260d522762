#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

#include "stasis/serialization/context.hpp"
#include "stasis/serialization/value.hpp"

namespace stasis::handlers {

/**
 * @brief Converter between one registered type and its JSON form
 *
 * A handler is created per flatten/restore call site, bound to exactly one
 * context and holds no other state. Derived handlers must implement both
 * operations.
 */
class BaseHandler {
public:
    explicit BaseHandler(serialization::Context& context)
        : context_(context) {}
    virtual ~BaseHandler() = default;

    BaseHandler(const BaseHandler&) = delete;
    BaseHandler& operator=(const BaseHandler&) = delete;

    // Flatten obj into a json-friendly form, writing the result into data
    virtual nlohmann::json flatten(const serialization::Value& obj,
                                   nlohmann::json& data) = 0;

    // Restore the json-friendly obj to the registered type
    virtual serialization::Value restore(const nlohmann::json& obj) = 0;

protected:
    // Logs and throws serialization::ContractViolation
    [[noreturn]] static void contract_violation(const std::string& message);

    serialization::Context& context_;
};

using HandlerFactory =
    std::function<std::unique_ptr<BaseHandler>(serialization::Context&)>;

template <typename Handler>
HandlerFactory make_handler_factory() {
    static_assert(std::is_base_of_v<BaseHandler, Handler>,
                  "Handler must inherit from BaseHandler");
    return [](serialization::Context& context) -> std::unique_ptr<BaseHandler> {
        return std::make_unique<Handler>(context);
    };
}

}  // namespace stasis::handlers
