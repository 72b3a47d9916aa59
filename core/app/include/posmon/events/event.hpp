#pragma once

#include "posmon/events/event_types.hpp"

#include <variant>

namespace posmon {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The envelope carried by EventBus. MonitorEngine is the only publisher;
// ConsoleReporter and tests subscribe. Adding an alternative means updating
// every std::visit over Event, which the compiler enforces.
// -----------------------------------------------------------------------------
using Event = std::variant<
    BaselineEvent,
    ChangeEvent,
    HeartbeatEvent,
    FetchFailureEvent,
    SinkFailureEvent,
    PersistenceFailureEvent>;

}  // namespace posmon
