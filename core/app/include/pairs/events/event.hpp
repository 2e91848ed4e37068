#pragma once

#include "pairs/events/event_types.hpp"

#include <variant>

namespace pairs {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by EventBus. Adding an event kind means
// adding it here; subscribers that use typed subscribe<T>() are unaffected.
// -----------------------------------------------------------------------------
using Event = std::variant<
    PositionOpenedEvent,
    PositionClosedEvent,
    EntrySkippedEvent,
    DailySnapshotEvent>;

}  // namespace pairs
