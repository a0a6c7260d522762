#include "stasis/types/temporal.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "arguments.hpp"

namespace stasis::types {

using serialization::Value;

namespace {

// Missing bytes of a foreign payload read as zero
int byte_at(const Value::Bytes& state, std::size_t index) {
    return index < state.size() ? state[index] : 0;
}

int read_microsecond(const Value::Bytes& state, std::size_t offset) {
    return (byte_at(state, offset) << 16) | (byte_at(state, offset + 1) << 8) |
           byte_at(state, offset + 2);
}

void put_microsecond(Value::Bytes& state, int microsecond) {
    state.push_back(static_cast<std::uint8_t>(microsecond >> 16));
    state.push_back(static_cast<std::uint8_t>((microsecond >> 8) & 0xFF));
    state.push_back(static_cast<std::uint8_t>(microsecond & 0xFF));
}

bool is_leap(int year) {
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

int days_in_month(int year, int month) {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30,
                                   31, 31, 30, 31, 30, 31};
    return month == 2 && is_leap(year) ? 29 : DAYS[month - 1];
}

void check_range(const char* field, int value, int low, int high) {
    if (value < low || value > high) {
        throw std::invalid_argument(std::string(field) + " must be in " +
                                    std::to_string(low) + ".." +
                                    std::to_string(high) + ", got " +
                                    std::to_string(value));
    }
}

void check_date(int year, int month, int day) {
    check_range("year", year, 1, 9999);
    check_range("month", month, 1, 12);
    check_range("day", day, 1, days_in_month(year, month));
}

void check_time(int hour, int minute, int second, int microsecond) {
    check_range("hour", hour, 0, 23);
    check_range("minute", minute, 0, 59);
    check_range("second", second, 0, 59);
    check_range("microsecond", microsecond, 0, 999999);
}

void write_date(std::ostream& os, int year, int month, int day) {
    os << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2)
       << month << '-' << std::setw(2) << day;
}

void write_time(std::ostream& os, int hour, int minute, int second,
                int microsecond, const std::shared_ptr<const TimeZone>& tz) {
    os << std::setfill('0') << std::setw(2) << hour << ':' << std::setw(2)
       << minute << ':' << std::setw(2) << second;
    if (microsecond != 0) {
        os << '.' << std::setw(6) << microsecond;
    }
    if (tz) {
        os << tz->utc_offset_string();
    }
}

bool same_zone(const std::shared_ptr<const TimeZone>& a,
               const std::shared_ptr<const TimeZone>& b) {
    if (!a || !b) {
        return !a && !b;
    }
    return a->equals(*b);
}

std::shared_ptr<const TimeZone> tz_arg(const Value::List& args,
                                       std::size_t index) {
    if (index >= args.size() || args[index].is_null()) {
        return nullptr;
    }
    return args[index].as<TimeZone>();
}

serialization::Reduction temporal_reduction(
    const std::shared_ptr<const serialization::Factory>& factory,
    const Value::Bytes& state, const std::shared_ptr<const TimeZone>& tz) {
    serialization::Reduction reduction{factory, {Value(state)}};
    if (tz) {
        reduction.arguments.emplace_back(tz);
    }
    return reduction;
}

}  // namespace

// ==================== Date ====================

Date::Date(int year, int month, int day) {
    check_date(year, month, day);
    state_ = {static_cast<std::uint8_t>(year >> 8),
              static_cast<std::uint8_t>(year & 0xFF),
              static_cast<std::uint8_t>(month), static_cast<std::uint8_t>(day)};
}

Date Date::from_state(Value::Bytes state) { return Date(std::move(state)); }

int Date::year() const { return (byte_at(state_, 0) << 8) | byte_at(state_, 1); }
int Date::month() const { return byte_at(state_, 2); }
int Date::day() const { return byte_at(state_, 3); }

serialization::Reduction Date::reduce() const {
    return temporal_reduction(factory(), state_, nullptr);
}

std::string Date::str() const {
    std::ostringstream oss;
    write_date(oss, year(), month(), day());
    return oss.str();
}

bool Date::equals(const serialization::Object& other) const {
    const auto* date = dynamic_cast<const Date*>(&other);
    return date != nullptr && typeid(*date) == typeid(*this) &&
           date->state_ == state_;
}

const std::shared_ptr<const serialization::Factory>& Date::factory() {
    static const auto instance = serialization::make_factory(
        "stasis.Date",
        [](const Value::List& args) -> Value {
            detail::check_arity(args, 3, 3, "stasis.Date");
            return std::make_shared<const Date>(
                detail::small_int_arg(args, 0, 1),
                detail::small_int_arg(args, 1, 1),
                detail::small_int_arg(args, 2, 1));
        },
        [](const Value::Bytes& state, const Value::List& rest) -> Value {
            detail::check_arity(rest, 0, 0, "stasis.Date state");
            return std::make_shared<const Date>(Date::from_state(state));
        });
    return instance;
}

// ==================== DateTime ====================

DateTime::DateTime(int year, int month, int day, int hour, int minute,
                   int second, int microsecond,
                   std::shared_ptr<const TimeZone> tzinfo)
    : tzinfo_(std::move(tzinfo)) {
    check_date(year, month, day);
    check_time(hour, minute, second, microsecond);
    state_ = {static_cast<std::uint8_t>(year >> 8),
              static_cast<std::uint8_t>(year & 0xFF),
              static_cast<std::uint8_t>(month),
              static_cast<std::uint8_t>(day),
              static_cast<std::uint8_t>(hour),
              static_cast<std::uint8_t>(minute),
              static_cast<std::uint8_t>(second)};
    put_microsecond(state_, microsecond);
}

DateTime DateTime::from_state(Value::Bytes state,
                              std::shared_ptr<const TimeZone> tzinfo) {
    return DateTime(std::move(state), std::move(tzinfo));
}

int DateTime::year() const {
    return (byte_at(state_, 0) << 8) | byte_at(state_, 1);
}
int DateTime::month() const { return byte_at(state_, 2); }
int DateTime::day() const { return byte_at(state_, 3); }
int DateTime::hour() const { return byte_at(state_, 4); }
int DateTime::minute() const { return byte_at(state_, 5); }
int DateTime::second() const { return byte_at(state_, 6); }
int DateTime::microsecond() const { return read_microsecond(state_, 7); }

serialization::Reduction DateTime::reduce() const {
    return temporal_reduction(factory(), state_, tzinfo_);
}

std::string DateTime::str() const {
    std::ostringstream oss;
    write_date(oss, year(), month(), day());
    oss << ' ';
    write_time(oss, hour(), minute(), second(), microsecond(), tzinfo_);
    return oss.str();
}

bool DateTime::equals(const serialization::Object& other) const {
    const auto* datetime = dynamic_cast<const DateTime*>(&other);
    return datetime != nullptr && typeid(*datetime) == typeid(*this) &&
           datetime->state_ == state_ && same_zone(datetime->tzinfo_, tzinfo_);
}

const std::shared_ptr<const serialization::Factory>& DateTime::factory() {
    static const auto instance = serialization::make_factory(
        "stasis.DateTime",
        [](const Value::List& args) -> Value {
            detail::check_arity(args, 3, 8, "stasis.DateTime");
            return std::make_shared<const DateTime>(
                detail::small_int_arg(args, 0, 1),
                detail::small_int_arg(args, 1, 1),
                detail::small_int_arg(args, 2, 1),
                detail::small_int_arg(args, 3, 0),
                detail::small_int_arg(args, 4, 0),
                detail::small_int_arg(args, 5, 0),
                detail::small_int_arg(args, 6, 0), tz_arg(args, 7));
        },
        [](const Value::Bytes& state, const Value::List& rest) -> Value {
            detail::check_arity(rest, 0, 1, "stasis.DateTime state");
            return std::make_shared<const DateTime>(
                DateTime::from_state(state, tz_arg(rest, 0)));
        });
    return instance;
}

// ==================== Time ====================

Time::Time(int hour, int minute, int second, int microsecond,
           std::shared_ptr<const TimeZone> tzinfo)
    : tzinfo_(std::move(tzinfo)) {
    check_time(hour, minute, second, microsecond);
    state_ = {static_cast<std::uint8_t>(hour),
              static_cast<std::uint8_t>(minute),
              static_cast<std::uint8_t>(second)};
    put_microsecond(state_, microsecond);
}

Time Time::from_state(Value::Bytes state,
                      std::shared_ptr<const TimeZone> tzinfo) {
    return Time(std::move(state), std::move(tzinfo));
}

int Time::hour() const { return byte_at(state_, 0); }
int Time::minute() const { return byte_at(state_, 1); }
int Time::second() const { return byte_at(state_, 2); }
int Time::microsecond() const { return read_microsecond(state_, 3); }

serialization::Reduction Time::reduce() const {
    return temporal_reduction(factory(), state_, tzinfo_);
}

std::string Time::str() const {
    std::ostringstream oss;
    write_time(oss, hour(), minute(), second(), microsecond(), tzinfo_);
    return oss.str();
}

bool Time::equals(const serialization::Object& other) const {
    const auto* time = dynamic_cast<const Time*>(&other);
    return time != nullptr && typeid(*time) == typeid(*this) &&
           time->state_ == state_ && same_zone(time->tzinfo_, tzinfo_);
}

const std::shared_ptr<const serialization::Factory>& Time::factory() {
    static const auto instance = serialization::make_factory(
        "stasis.Time",
        [](const Value::List& args) -> Value {
            detail::check_arity(args, 0, 5, "stasis.Time");
            return std::make_shared<const Time>(
                detail::small_int_arg(args, 0, 0),
                detail::small_int_arg(args, 1, 0),
                detail::small_int_arg(args, 2, 0),
                detail::small_int_arg(args, 3, 0), tz_arg(args, 4));
        },
        [](const Value::Bytes& state, const Value::List& rest) -> Value {
            detail::check_arity(rest, 0, 1, "stasis.Time state");
            return std::make_shared<const Time>(
                Time::from_state(state, tz_arg(rest, 0)));
        });
    return instance;
}

}  // namespace stasis::types
