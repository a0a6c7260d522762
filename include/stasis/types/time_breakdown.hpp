#pragma once

#include <array>
#include <ctime>
#include <memory>
#include <string>

#include "stasis/serialization/object.hpp"

namespace stasis::types {

/**
 * @brief Calendar breakdown of a point in time, one field per component
 *
 * Field order: year, month (1-12), mday, hour, minute, second, wday
 * (Monday = 0), yday (1-366), isdst. Unlike std::tm the fields are stored
 * as read, without offsets. Reduces to (TimeBreakdown, [[nine fields]]).
 */
class TimeBreakdown : public serialization::Reconstructible {
public:
    static constexpr std::size_t FIELD_COUNT = 9;
    using Fields = std::array<int, FIELD_COUNT>;

    explicit TimeBreakdown(const Fields& fields) : fields_(fields) {}
    explicit TimeBreakdown(const std::tm& tm);

    std::tm to_tm() const;

    int year() const { return fields_[0]; }
    int month() const { return fields_[1]; }
    int mday() const { return fields_[2]; }
    int hour() const { return fields_[3]; }
    int minute() const { return fields_[4]; }
    int second() const { return fields_[5]; }
    int wday() const { return fields_[6]; }
    int yday() const { return fields_[7]; }
    int isdst() const { return fields_[8]; }
    const Fields& fields() const { return fields_; }

    serialization::Reduction reduce() const override;
    std::string str() const override;
    bool equals(const serialization::Object& other) const override;

    static const std::shared_ptr<const serialization::Factory>& factory();

private:
    Fields fields_;
};

}  // namespace stasis::types
