#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "stasis/serialization/object.hpp"

namespace stasis::types {

/**
 * @brief Signed time delta with microsecond resolution
 *
 * Stored normalized: 0 <= seconds < 86400 and 0 <= microseconds < 1000000,
 * the sign lives in days. Reduces to (Duration, [days, seconds, microseconds]).
 */
class Duration : public serialization::Reconstructible {
public:
    static constexpr std::int64_t MAX_DAYS = 999999999;

    Duration() = default;
    explicit Duration(std::int64_t days, std::int64_t seconds = 0,
                      std::int64_t microseconds = 0);

    static Duration from_seconds(std::int64_t seconds) {
        return Duration(0, seconds);
    }

    std::int64_t days() const { return days_; }
    std::int64_t seconds() const { return seconds_; }
    std::int64_t microseconds() const { return microseconds_; }

    double total_seconds() const;
    bool is_negative() const { return days_ < 0; }

    serialization::Reduction reduce() const override;
    std::string str() const override;
    bool equals(const serialization::Object& other) const override;

    bool operator==(const Duration& other) const {
        return days_ == other.days_ && seconds_ == other.seconds_ &&
               microseconds_ == other.microseconds_;
    }

    static const std::shared_ptr<const serialization::Factory>& factory();

private:
    std::int64_t days_ = 0;
    std::int64_t seconds_ = 0;
    std::int64_t microseconds_ = 0;
};

}  // namespace stasis::types
