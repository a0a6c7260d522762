#include "stasis/types/duration.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "arguments.hpp"

namespace stasis::types {

using serialization::Value;

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;
constexpr std::int64_t MICROS_PER_SECOND = 1000000;

// Floor division, the remainder takes the sign of the divisor
void floor_divmod(std::int64_t value, std::int64_t divisor,
                  std::int64_t& quotient, std::int64_t& remainder) {
    quotient = value / divisor;
    remainder = value % divisor;
    if (remainder < 0) {
        remainder += divisor;
        --quotient;
    }
}

// Adds two day or second counts, rejecting sums that do not fit in 64 bits
std::int64_t checked_add(std::int64_t lhs, std::int64_t rhs) {
    using limits = std::numeric_limits<std::int64_t>;
    if ((rhs > 0 && lhs > limits::max() - rhs) ||
        (rhs < 0 && lhs < limits::min() - rhs)) {
        throw std::invalid_argument("Duration component overflows: " +
                                    std::to_string(lhs) + " + " +
                                    std::to_string(rhs));
    }
    return lhs + rhs;
}

}  // namespace

Duration::Duration(std::int64_t days, std::int64_t seconds,
                   std::int64_t microseconds) {
    std::int64_t carry = 0;
    floor_divmod(microseconds, MICROS_PER_SECOND, carry, microseconds_);
    floor_divmod(checked_add(seconds, carry), SECONDS_PER_DAY, carry,
                 seconds_);
    days_ = checked_add(days, carry);

    if (days_ > MAX_DAYS || days_ < -MAX_DAYS) {
        throw std::invalid_argument("Duration of " + std::to_string(days_) +
                                    " days is out of range");
    }
}

double Duration::total_seconds() const {
    return static_cast<double>(days_) * SECONDS_PER_DAY +
           static_cast<double>(seconds_) +
           static_cast<double>(microseconds_) / MICROS_PER_SECOND;
}

serialization::Reduction Duration::reduce() const {
    return {factory(), {Value(days_), Value(seconds_), Value(microseconds_)}};
}

std::string Duration::str() const {
    std::ostringstream oss;
    if (days_ != 0) {
        oss << days_ << (days_ == 1 || days_ == -1 ? " day, " : " days, ");
    }
    oss << seconds_ / 3600 << ':' << std::setfill('0') << std::setw(2)
        << seconds_ % 3600 / 60 << ':' << std::setw(2) << seconds_ % 60;
    if (microseconds_ != 0) {
        oss << '.' << std::setw(6) << microseconds_;
    }
    return oss.str();
}

bool Duration::equals(const serialization::Object& other) const {
    const auto* duration = dynamic_cast<const Duration*>(&other);
    return duration != nullptr && typeid(*duration) == typeid(*this) &&
           *duration == *this;
}

const std::shared_ptr<const serialization::Factory>& Duration::factory() {
    static const auto instance = serialization::make_factory(
        "stasis.Duration", [](const Value::List& args) -> Value {
            detail::check_arity(args, 0, 3, "stasis.Duration");
            return std::make_shared<const Duration>(
                detail::int_arg(args, 0, 0), detail::int_arg(args, 1, 0),
                detail::int_arg(args, 2, 0));
        });
    return instance;
}

}  // namespace stasis::types
