#pragma once

#include <memory>
#include <optional>
#include <string>

#include "stasis/types/duration.hpp"

namespace stasis::types {

// Fixed offset from UTC, strictly within one day either side
class TimeZone : public serialization::Reconstructible {
public:
    explicit TimeZone(Duration offset,
                      std::optional<std::string> name = std::nullopt);

    static const std::shared_ptr<const TimeZone>& utc();

    const Duration& offset() const { return offset_; }
    const std::optional<std::string>& name() const { return name_; }

    // "+05:30", "-08:00", seconds and microseconds appended when present
    std::string utc_offset_string() const;

    serialization::Reduction reduce() const override;
    std::string str() const override;
    bool equals(const serialization::Object& other) const override;

    static const std::shared_ptr<const serialization::Factory>& factory();

private:
    Duration offset_;
    std::optional<std::string> name_;
};

}  // namespace stasis::types
