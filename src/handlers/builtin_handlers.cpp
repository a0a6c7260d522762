#include "stasis/handlers/builtin_handlers.hpp"

#include "stasis/handlers/reduce_handler.hpp"
#include "stasis/handlers/temporal_handler.hpp"
#include "stasis/types/duration.hpp"
#include "stasis/types/ordered_map.hpp"
#include "stasis/types/temporal.hpp"
#include "stasis/types/time_breakdown.hpp"
#include "stasis/types/timezone.hpp"

namespace stasis::handlers {

void register_builtin_handlers(HandlerRegistry& registry) {
    registry.register_handler<types::DateTime, TemporalHandler>();
    registry.register_handler<types::Date, TemporalHandler>();
    registry.register_handler<types::Time, TemporalHandler>();

    registry.register_handler<types::TimeBreakdown, ReduceHandler>();
    registry.register_handler<types::Duration, ReduceHandler>();
    registry.register_handler<types::OrderedMap, ReduceHandler>();
    registry.register_handler<types::TimeZone, ReduceHandler>();
}

}  // namespace stasis::handlers
