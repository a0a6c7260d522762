#include "stasis/types/builtin_types.hpp"

#include "stasis/types/duration.hpp"
#include "stasis/types/ordered_map.hpp"
#include "stasis/types/temporal.hpp"
#include "stasis/types/time_breakdown.hpp"
#include "stasis/types/timezone.hpp"

namespace stasis::types {

void register_builtin_types(serialization::TypeCatalog& catalog) {
    catalog.add<DateTime>(DateTime::factory());
    catalog.add<Date>(Date::factory());
    catalog.add<Time>(Time::factory());
    catalog.add<TimeZone>(TimeZone::factory());
    catalog.add<Duration>(Duration::factory());
    catalog.add<TimeBreakdown>(TimeBreakdown::factory());
    catalog.add<OrderedMap>(OrderedMap::factory());
}

}  // namespace stasis::types
