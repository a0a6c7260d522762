#include "stasis/handlers/temporal_handler.hpp"

#include <iterator>

#include "stasis/serialization/base64.hpp"
#include "stasis/serialization/tags.hpp"

namespace stasis::handlers {

using serialization::Reduction;
using serialization::Value;
namespace base64 = serialization::base64;
namespace tags = serialization::tags;

nlohmann::json TemporalHandler::flatten(const Value& obj,
                                        nlohmann::json& data) {
    if (!context_.unpicklable()) {
        return obj.str();
    }

    const Reduction reduction = reduction_of(obj);
    if (reduction.arguments.empty() || !reduction.arguments.front().is_bytes()) {
        contract_violation("temporal reduction must start with a byte state: " +
                           obj.str());
    }

    nlohmann::json args = nlohmann::json::array();
    args.push_back(base64::encode(reduction.arguments.front().as_bytes()));
    for (auto it = std::next(reduction.arguments.begin());
         it != reduction.arguments.end(); ++it) {
        args.push_back(context_.flatten(*it, false));
    }

    data[tags::REDUCE] = nlohmann::json::array(
        {context_.flatten(Value(reduction.factory), false), std::move(args)});
    return data;
}

Value TemporalHandler::restore(const nlohmann::json& obj) {
    const nlohmann::json& marker = reduce_marker(obj);
    const nlohmann::json& args = marker[1];
    if (args.empty() || !args[0].is_string()) {
        contract_violation("temporal state must be a base64 string, got " +
                           args.dump());
    }

    const Value::Bytes state = base64::decode(args[0].get<std::string>());

    auto factory = restore_factory(marker[0]);

    Value::List rest;
    rest.reserve(args.size() - 1);
    for (std::size_t i = 1; i < args.size(); ++i) {
        rest.push_back(context_.restore(args[i], false));
    }

    return factory->from_state(state, rest);
}

}  // namespace stasis::handlers
