#include "stasis/types/timezone.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "arguments.hpp"

namespace stasis::types {

using serialization::Value;

TimeZone::TimeZone(Duration offset, std::optional<std::string> name)
    : offset_(std::move(offset)), name_(std::move(name)) {
    const bool within_day =
        offset_.days() == 0 ||
        (offset_.days() == -1 &&
         (offset_.seconds() != 0 || offset_.microseconds() != 0));
    if (!within_day) {
        throw std::invalid_argument(
            "TimeZone offset must be strictly between -24h and 24h, got " +
            offset_.str());
    }
}

const std::shared_ptr<const TimeZone>& TimeZone::utc() {
    static const auto instance = std::make_shared<const TimeZone>(Duration());
    return instance;
}

std::string TimeZone::utc_offset_string() const {
    std::int64_t micros = offset_.days() * 86400000000LL +
                          offset_.seconds() * 1000000LL +
                          offset_.microseconds();
    const char sign = micros < 0 ? '-' : '+';
    if (micros < 0) {
        micros = -micros;
    }

    const std::int64_t total_seconds = micros / 1000000;
    const std::int64_t fraction = micros % 1000000;

    std::ostringstream oss;
    oss << sign << std::setfill('0') << std::setw(2) << total_seconds / 3600
        << ':' << std::setw(2) << total_seconds % 3600 / 60;
    if (total_seconds % 60 != 0 || fraction != 0) {
        oss << ':' << std::setw(2) << total_seconds % 60;
    }
    if (fraction != 0) {
        oss << '.' << std::setw(6) << fraction;
    }
    return oss.str();
}

serialization::Reduction TimeZone::reduce() const {
    serialization::Reduction reduction{
        factory(), {Value(std::make_shared<const Duration>(offset_))}};
    if (name_) {
        reduction.arguments.emplace_back(*name_);
    }
    return reduction;
}

std::string TimeZone::str() const {
    if (name_) {
        return *name_;
    }
    if (offset_ == Duration()) {
        return "UTC";
    }
    return "UTC" + utc_offset_string();
}

bool TimeZone::equals(const serialization::Object& other) const {
    const auto* zone = dynamic_cast<const TimeZone*>(&other);
    return zone != nullptr && typeid(*zone) == typeid(*this) &&
           zone->offset_ == offset_ && zone->name_ == name_;
}

const std::shared_ptr<const serialization::Factory>& TimeZone::factory() {
    static const auto instance = serialization::make_factory(
        "stasis.TimeZone", [](const Value::List& args) -> Value {
            detail::check_arity(args, 1, 2, "stasis.TimeZone");
            std::optional<std::string> name;
            if (args.size() == 2 && !args[1].is_null()) {
                name = args[1].as_string();
            }
            return std::make_shared<const TimeZone>(*args[0].as<Duration>(),
                                                    std::move(name));
        });
    return instance;
}

}  // namespace stasis::types
