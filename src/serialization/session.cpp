#include "stasis/serialization/session.hpp"

#include <cstdint>
#include <limits>

#include "stasis/log/logger.hpp"
#include "stasis/serialization/base64.hpp"
#include "stasis/serialization/tags.hpp"

namespace stasis::serialization {

// Counts one level of nesting for the lifetime of a flatten/restore call
class Session::DepthGuard {
public:
    explicit DepthGuard(Session& session)
        : session_(session), saved_depth_(session.depth_) {
        if (++session_.depth_ > session_.config_.max_depth) {
            session_.depth_ = saved_depth_;
            throw SerializationException(
                "maximum nesting depth " +
                std::to_string(session_.config_.max_depth) + " exceeded");
        }
    }

    ~DepthGuard() { session_.depth_ = saved_depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    Session& session_;
    int saved_depth_;
};

namespace {

const std::string& tag_string(const nlohmann::json& obj, const char* tag) {
    const auto& value = obj.at(tag);
    if (!value.is_string()) {
        throw SerializationException(std::string(tag) +
                                     " must be a string, got " + value.dump());
    }
    return value.get_ref<const std::string&>();
}

}  // namespace

Session::Session(SessionConfig config, handlers::HandlerRegistry& registry,
                 TypeCatalog& catalog)
    : config_(std::move(config)), registry_(registry), catalog_(catalog) {
    config_.validate();
}

nlohmann::json Session::flatten(const Value& obj, bool reset) {
    if (reset) {
        depth_ = 0;
    }
    DepthGuard guard(*this);

    if (obj.is_null()) {
        return nullptr;
    }
    if (obj.is_bool()) {
        return obj.as_bool();
    }
    if (obj.is_int()) {
        return obj.as_int();
    }
    if (obj.is_double()) {
        return obj.as_double();
    }
    if (obj.is_string()) {
        return obj.as_string();
    }
    if (obj.is_bytes()) {
        return {{tags::BYTES, base64::encode(obj.as_bytes())}};
    }
    if (obj.is_list()) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& item : obj.as_list()) {
            items.push_back(flatten(item, false));
        }
        return items;
    }
    if (obj.is_factory()) {
        return {{tags::TYPE, obj.as_factory()->name()}};
    }
    return flatten_object(obj.as_object());
}

nlohmann::json Session::flatten_object(const Value::ObjectPtr& obj) {
    const std::type_index type(typeid(*obj));

    auto factory = registry_.lookup(type);
    if (!factory) {
        if (!config_.unpicklable) {
            return obj->str();
        }
        throw SerializationException(std::string("no handler registered for ") +
                                     type.name());
    }

    nlohmann::json data = nlohmann::json::object();
    if (config_.unpicklable) {
        auto name = catalog_.name_of(type);
        if (!name) {
            throw SerializationException(std::string("type ") + type.name() +
                                         " has a handler but no catalog name");
        }
        data[tags::OBJECT] = *name;
    }

    if (log::Logger::dispatch_trace()) {
        STASIS_LOG_TRACE << "Flattening " << type.name() << " at depth "
                         << depth_;
    }
    auto handler = (*factory)(*this);
    return handler->flatten(Value(obj), data);
}

Value Session::restore(const nlohmann::json& obj, bool reset) {
    if (reset) {
        depth_ = 0;
    }
    DepthGuard guard(*this);

    switch (obj.type()) {
        case nlohmann::json::value_t::null:
            return nullptr;
        case nlohmann::json::value_t::boolean:
            return obj.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return obj.get<std::int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            const auto value = obj.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(
                            std::numeric_limits<std::int64_t>::max())) {
                throw SerializationException("integer " + obj.dump() +
                                             " does not fit in 64 bits");
            }
            return static_cast<std::int64_t>(value);
        }
        case nlohmann::json::value_t::number_float:
            return obj.get<double>();
        case nlohmann::json::value_t::string:
            return obj.get<std::string>();
        case nlohmann::json::value_t::array: {
            Value::List items;
            items.reserve(obj.size());
            for (const auto& item : obj) {
                items.push_back(restore(item, false));
            }
            return items;
        }
        case nlohmann::json::value_t::object:
            return restore_tagged(obj);
        default:
            throw SerializationException(std::string("unsupported JSON node: ") +
                                         obj.type_name());
    }
}

Value Session::restore_tagged(const nlohmann::json& obj) {
    if (obj.contains(tags::OBJECT)) {
        return restore_object(obj);
    }
    if (obj.contains(tags::TYPE)) {
        const auto& name = tag_string(obj, tags::TYPE);
        auto factory = catalog_.factory(name);
        if (!factory) {
            throw SerializationException("unknown factory: " + name);
        }
        return factory;
    }
    if (obj.contains(tags::BYTES)) {
        return base64::decode(tag_string(obj, tags::BYTES));
    }
    throw SerializationException("untagged JSON object cannot be restored: " +
                                 obj.dump());
}

Value Session::restore_object(const nlohmann::json& obj) {
    const auto& name = tag_string(obj, tags::OBJECT);

    auto type = catalog_.type_of(name);
    if (!type) {
        throw SerializationException("unknown type name: " + name);
    }

    auto factory = registry_.lookup(*type);
    if (!factory) {
        throw SerializationException("no handler registered for " + name);
    }

    if (log::Logger::dispatch_trace()) {
        STASIS_LOG_TRACE << "Restoring " << name << " at depth " << depth_;
    }
    auto handler = (*factory)(*this);
    return handler->restore(obj);
}

std::string Session::encode(const Value& obj) {
    return flatten(obj).dump(config_.indent);
}

Value Session::decode(const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw SerializationException("JSON parse failed: " +
                                     std::string(e.what()));
    }
    return restore(document);
}

std::string encode(const Value& obj, bool unpicklable) {
    SessionConfig config;
    config.unpicklable = unpicklable;
    return Session(config).encode(obj);
}

Value decode(const std::string& text) { return Session().decode(text); }

}  // namespace stasis::serialization
