#pragma once

#include <memory>
#include <string>

#include "stasis/serialization/object.hpp"
#include "stasis/types/timezone.hpp"

namespace stasis::types {

/**
 * @brief Calendar date, state [year_hi, year_lo, month, day]
 *
 * The public constructor validates its fields. from_state() is the raw-state
 * constructor used when restoring documents: it keeps the payload exactly as
 * given, so accessors on a payload that never came from reduce() return
 * whatever the bytes say.
 */
class Date : public serialization::Reconstructible {
public:
    static constexpr std::size_t STATE_SIZE = 4;

    Date(int year, int month, int day);
    static Date from_state(serialization::Value::Bytes state);

    int year() const;
    int month() const;
    int day() const;
    const serialization::Value::Bytes& state() const { return state_; }

    serialization::Reduction reduce() const override;
    std::string str() const override;
    bool equals(const serialization::Object& other) const override;

    static const std::shared_ptr<const serialization::Factory>& factory();

private:
    explicit Date(serialization::Value::Bytes state)
        : state_(std::move(state)) {}

    serialization::Value::Bytes state_;
};

/**
 * @brief Date and time of day with microsecond resolution
 *
 * State [year_hi, year_lo, month, day, hour, minute, second, us2, us1, us0],
 * plus an optional fixed-offset time zone that travels as a separate
 * reduction argument.
 */
class DateTime : public serialization::Reconstructible {
public:
    static constexpr std::size_t STATE_SIZE = 10;

    DateTime(int year, int month, int day, int hour = 0, int minute = 0,
             int second = 0, int microsecond = 0,
             std::shared_ptr<const TimeZone> tzinfo = nullptr);
    static DateTime from_state(serialization::Value::Bytes state,
                               std::shared_ptr<const TimeZone> tzinfo = nullptr);

    int year() const;
    int month() const;
    int day() const;
    int hour() const;
    int minute() const;
    int second() const;
    int microsecond() const;
    const std::shared_ptr<const TimeZone>& tzinfo() const { return tzinfo_; }
    const serialization::Value::Bytes& state() const { return state_; }

    Date date() const { return Date(year(), month(), day()); }

    serialization::Reduction reduce() const override;
    std::string str() const override;
    bool equals(const serialization::Object& other) const override;

    static const std::shared_ptr<const serialization::Factory>& factory();

private:
    DateTime(serialization::Value::Bytes state,
             std::shared_ptr<const TimeZone> tzinfo)
        : state_(std::move(state)), tzinfo_(std::move(tzinfo)) {}

    serialization::Value::Bytes state_;
    std::shared_ptr<const TimeZone> tzinfo_;
};

// Time of day, state [hour, minute, second, us2, us1, us0]
class Time : public serialization::Reconstructible {
public:
    static constexpr std::size_t STATE_SIZE = 6;

    explicit Time(int hour = 0, int minute = 0, int second = 0,
                  int microsecond = 0,
                  std::shared_ptr<const TimeZone> tzinfo = nullptr);
    static Time from_state(serialization::Value::Bytes state,
                           std::shared_ptr<const TimeZone> tzinfo = nullptr);

    int hour() const;
    int minute() const;
    int second() const;
    int microsecond() const;
    const std::shared_ptr<const TimeZone>& tzinfo() const { return tzinfo_; }
    const serialization::Value::Bytes& state() const { return state_; }

    serialization::Reduction reduce() const override;
    std::string str() const override;
    bool equals(const serialization::Object& other) const override;

    static const std::shared_ptr<const serialization::Factory>& factory();

private:
    Time(serialization::Value::Bytes state,
         std::shared_ptr<const TimeZone> tzinfo)
        : state_(std::move(state)), tzinfo_(std::move(tzinfo)) {}

    serialization::Value::Bytes state_;
    std::shared_ptr<const TimeZone> tzinfo_;
};

}  // namespace stasis::types
