#pragma once

#include "stasis/handlers/handler_registry.hpp"

namespace stasis::handlers {

// Temporal points to TemporalHandler; durations, time zones, calendar
// breakdowns and ordered maps to ReduceHandler
void register_builtin_handlers(HandlerRegistry& registry);

}  // namespace stasis::handlers
