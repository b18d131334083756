#pragma once

#include "sentinel/events/event_types.hpp"

#include <variant>

namespace sentinel {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus. Adding an alternative means
// updating every std::visit site (the IPC telemetry formatter in particular);
// the compiler enforces it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    EvDecisionEvent,
    IntentDeniedEvent,
    OrderUpdateEvent,
    FillEvent,
    KillSwitchEvent,
    AnomalyDetectedEvent,
    ReconciliationEvent>;

}  // namespace sentinel
