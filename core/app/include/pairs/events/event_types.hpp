#pragma once

#include "pairs/domain/direction.hpp"
#include "pairs/domain/equity_point.hpp"
#include "pairs/domain/position.hpp"
#include "pairs/domain/trade_record.hpp"
#include "pairs/time/time_utils.hpp"

#include <string>

namespace pairs {

// -----------------------------------------------------------------------------
// PositionOpenedEvent
// -----------------------------------------------------------------------------
// Published by PositionLedger after a successful open(). Carries a copy of
// the new position and the Entry trade record appended for it.
// -----------------------------------------------------------------------------
struct PositionOpenedEvent {
  domain::Position position;
  domain::TradeRecord trade;
};

// -----------------------------------------------------------------------------
// PositionClosedEvent
// -----------------------------------------------------------------------------
// Published by PositionLedger after close() realizes a position. The trade
// record is the Exit entry (realized_pnl, pnl_pct, close_reason set).
// -----------------------------------------------------------------------------
struct PositionClosedEvent {
  domain::TradeRecord trade;
  double available_capital{0.0};  // Ledger state right after the close
};

enum class SkipReason {
  MaxPositions,
  InsufficientCapital,
};

inline const char* skipReasonToString(SkipReason r) {
  switch (r) {
    case SkipReason::MaxPositions:        return "MaxPositions";
    case SkipReason::InsufficientCapital: return "InsufficientCapital";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// EntrySkippedEvent
// -----------------------------------------------------------------------------
// A valid entry signal that the ledger refused for a capacity reason. Not an
// error: the run continues and the skipped counter is incremented.
// -----------------------------------------------------------------------------
struct EntrySkippedEvent {
  Date date{0};
  std::string pair_id;
  domain::Direction direction{domain::Direction::Long};
  SkipReason reason{SkipReason::MaxPositions};
  double available_capital{0.0};
  double required_capital{0.0};
};

// Published by SimulationEngine once per processed date.
struct DailySnapshotEvent {
  domain::EquityPoint point;
};

}  // namespace pairs
