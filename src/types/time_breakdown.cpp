#include "stasis/types/time_breakdown.hpp"

#include <sstream>
#include <stdexcept>

#include "arguments.hpp"

namespace stasis::types {

using serialization::Value;

namespace {

constexpr const char* FIELD_NAMES[TimeBreakdown::FIELD_COUNT] = {
    "tm_year", "tm_mon", "tm_mday", "tm_hour", "tm_min",
    "tm_sec",  "tm_wday", "tm_yday", "tm_isdst"};

}  // namespace

TimeBreakdown::TimeBreakdown(const std::tm& tm)
    : fields_{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
              tm.tm_hour,        tm.tm_min,     tm.tm_sec,
              (tm.tm_wday + 6) % 7, tm.tm_yday + 1, tm.tm_isdst} {}

std::tm TimeBreakdown::to_tm() const {
    std::tm tm{};
    tm.tm_year = year() - 1900;
    tm.tm_mon = month() - 1;
    tm.tm_mday = mday();
    tm.tm_hour = hour();
    tm.tm_min = minute();
    tm.tm_sec = second();
    tm.tm_wday = (wday() + 1) % 7;
    tm.tm_yday = yday() - 1;
    tm.tm_isdst = isdst();
    return tm;
}

serialization::Reduction TimeBreakdown::reduce() const {
    Value::List fields;
    fields.reserve(FIELD_COUNT);
    for (int field : fields_) {
        fields.emplace_back(field);
    }
    return {factory(), {Value(std::move(fields))}};
}

std::string TimeBreakdown::str() const {
    std::ostringstream oss;
    oss << "TimeBreakdown(";
    for (std::size_t i = 0; i < FIELD_COUNT; ++i) {
        if (i > 0) oss << ", ";
        oss << FIELD_NAMES[i] << '=' << fields_[i];
    }
    oss << ')';
    return oss.str();
}

bool TimeBreakdown::equals(const serialization::Object& other) const {
    const auto* breakdown = dynamic_cast<const TimeBreakdown*>(&other);
    return breakdown != nullptr && typeid(*breakdown) == typeid(*this) &&
           breakdown->fields_ == fields_;
}

const std::shared_ptr<const serialization::Factory>& TimeBreakdown::factory() {
    static const auto instance = serialization::make_factory(
        "stasis.TimeBreakdown", [](const Value::List& args) -> Value {
            detail::check_arity(args, 1, 1, "stasis.TimeBreakdown");
            const auto& items = args[0].as_list();
            if (items.size() != FIELD_COUNT) {
                throw std::invalid_argument(
                    "stasis.TimeBreakdown needs 9 fields, got " +
                    std::to_string(items.size()));
            }
            Fields fields{};
            for (std::size_t i = 0; i < FIELD_COUNT; ++i) {
                fields[i] = detail::small_int_arg(items, i, 0);
            }
            return std::make_shared<const TimeBreakdown>(fields);
        });
    return instance;
}

}  // namespace stasis::types
