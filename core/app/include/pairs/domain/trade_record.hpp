#pragma once

#include "pairs/domain/direction.hpp"
#include "pairs/time/time_utils.hpp"

#include <optional>
#include <string>

namespace pairs {
namespace domain {

enum class TradeEventType {
  Entry,
  Exit,
};

enum class CloseReason {
  MeanReversion,
  Horizon,
  EndOfBacktest,
};

// -----------------------------------------------------------------------------
// TradeRecord — append-only audit trail entry
// -----------------------------------------------------------------------------
//
// @brief  One Entry or Exit event in the trade log. Never mutated after it
//         has been appended by the PositionLedger.
//
// @details
// Exit-only fields (realized_pnl, pnl_pct, close_reason) are left at their
// defaults on Entry records.
//
// realized_pnl is NET of costs: for outcome-based positions the entry fees
// are subtracted; for price-based positions the cost is already folded
// into the entry/exit prices. cost reports the friction attributed to the
// trade in either representation (informational on price-based exits).
//
// pnl_pct = realized_pnl / invested_capital * 100, or 0 when nothing was
// invested.
// -----------------------------------------------------------------------------
struct TradeRecord {
  Date date{0};
  std::string pair_id;
  TradeEventType event_type{TradeEventType::Entry};
  Direction direction{Direction::Long};
  double price{0.0};             // Cost-adjusted spread price (0 if outcome-based)
  double invested_capital{0.0};
  double cost{0.0};
  double realized_pnl{0.0};
  double pnl_pct{0.0};
  std::optional<CloseReason> close_reason;
};

inline const char* tradeEventTypeToString(TradeEventType t) {
  switch (t) {
    case TradeEventType::Entry: return "entry";
    case TradeEventType::Exit:  return "exit";
  }
  return "unknown";
}

inline const char* closeReasonToString(CloseReason r) {
  switch (r) {
    case CloseReason::MeanReversion: return "Mean Reversion";
    case CloseReason::Horizon:       return "Horizon";
    case CloseReason::EndOfBacktest: return "End of Backtest";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace pairs
