#include "stasis/serialization/value.hpp"

#include <iomanip>
#include <sstream>

#include "stasis/serialization/object.hpp"

namespace stasis::serialization {

Value::Value(FactoryPtr factory) {
    if (factory) {
        data_ = std::move(factory);
    } else {
        data_ = nullptr;
    }
}

Value::Value(ObjectPtr object) {
    if (object) {
        data_ = std::move(object);
    } else {
        data_ = nullptr;
    }
}

double Value::as_double() const {
    if (const auto* value = std::get_if<std::int64_t>(&data_)) {
        return static_cast<double>(*value);
    }
    return get<double>("double");
}

std::string Value::type_name() const {
    switch (data_.index()) {
        case 0:
            return "null";
        case 1:
            return "bool";
        case 2:
            return "int";
        case 3:
            return "double";
        case 4:
            return "string";
        case 5:
            return "bytes";
        case 6:
            return "list";
        case 7:
            return "factory";
        case 8:
            return "object";
        default:
            return "unknown";
    }
}

std::string Value::str() const {
    if (is_string()) {
        return as_string();
    }
    return repr();
}

std::string Value::repr() const {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                oss << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                oss << (value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                oss << value;
            } else if constexpr (std::is_same_v<T, double>) {
                oss << std::setprecision(17) << value;
            } else if constexpr (std::is_same_v<T, std::string>) {
                oss << std::quoted(value, '\'');
            } else if constexpr (std::is_same_v<T, Bytes>) {
                oss << "bytes(" << std::hex << std::setfill('0');
                for (auto byte : value) {
                    oss << std::setw(2) << static_cast<int>(byte);
                }
                oss << ")";
            } else if constexpr (std::is_same_v<T, List>) {
                oss << "[";
                for (std::size_t i = 0; i < value.size(); ++i) {
                    if (i > 0) oss << ", ";
                    oss << value[i].repr();
                }
                oss << "]";
            } else if constexpr (std::is_same_v<T, FactoryPtr>) {
                oss << "<factory " << value->name() << ">";
            } else {
                oss << value->str();
            }
        },
        data_);
    return oss.str();
}

bool Value::operator==(const Value& other) const {
    if (data_.index() != other.data_.index()) {
        return false;
    }
    if (const auto* factory = std::get_if<FactoryPtr>(&data_)) {
        return (*factory)->name() == other.as_factory()->name();
    }
    if (const auto* object = std::get_if<ObjectPtr>(&data_)) {
        return (*object)->equals(*other.as_object());
    }
    return data_ == other.data_;
}

}  // namespace stasis::serialization
