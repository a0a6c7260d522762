#include "stasis/handlers/reduce_handler.hpp"

#include "stasis/serialization/tags.hpp"

namespace stasis::handlers {

using serialization::Reconstructible;
using serialization::Reduction;
using serialization::Value;
namespace tags = serialization::tags;

nlohmann::json ReduceHandler::flatten(const Value& obj, nlohmann::json& data) {
    if (!context_.unpicklable()) {
        return obj.str();
    }

    const Reduction reduction = reduction_of(obj);

    nlohmann::json args = nlohmann::json::array();
    for (const auto& arg : reduction.arguments) {
        args.push_back(context_.flatten(arg, false));
    }

    data[tags::REDUCE] = nlohmann::json::array(
        {context_.flatten(Value(reduction.factory), false), std::move(args)});
    return data;
}

Value ReduceHandler::restore(const nlohmann::json& obj) {
    const nlohmann::json& marker = reduce_marker(obj);

    auto factory = restore_factory(marker[0]);

    Value::List args;
    args.reserve(marker[1].size());
    for (const auto& arg : marker[1]) {
        args.push_back(context_.restore(arg, false));
    }

    return (*factory)(args);
}

Reduction ReduceHandler::reduction_of(const Value& obj) const {
    if (!obj.is_object()) {
        contract_violation("cannot reduce a " + obj.type_name());
    }
    const auto* reconstructible =
        dynamic_cast<const Reconstructible*>(obj.as_object().get());
    if (!reconstructible) {
        contract_violation("object does not implement reduce(): " + obj.str());
    }

    Reduction reduction = reconstructible->reduce();
    if (!reduction.factory) {
        contract_violation("reduce() returned no factory for " + obj.str());
    }
    return reduction;
}

const nlohmann::json& ReduceHandler::reduce_marker(
    const nlohmann::json& obj) const {
    if (!obj.is_object() || !obj.contains(tags::REDUCE)) {
        contract_violation(std::string("document has no ") + tags::REDUCE +
                           " marker");
    }

    const nlohmann::json& marker = obj.at(tags::REDUCE);
    if (!marker.is_array() || marker.size() != 2 || !marker[1].is_array()) {
        contract_violation(std::string(tags::REDUCE) +
                           " must be [factory, [arguments...]], got " +
                           marker.dump());
    }
    return marker;
}

Value::FactoryPtr ReduceHandler::restore_factory(const nlohmann::json& encoded) {
    Value factory = context_.restore(encoded, false);
    if (!factory.is_factory()) {
        contract_violation("reconstruction factory restored as a " +
                           factory.type_name());
    }
    return factory.as_factory();
}

}  // namespace stasis::handlers
