#pragma once

#include "pairs/domain/direction.hpp"
#include "pairs/time/time_utils.hpp"

#include <optional>
#include <string>

namespace pairs {
namespace domain {

// -----------------------------------------------------------------------------
// Position — one open exposure to a pair
// -----------------------------------------------------------------------------
//
// @brief  Plain value type describing a live position held by the
//         PositionLedger.
//
// @details
// Two PnL representations share this struct:
//
//   Price-based (Signal Reversal exits):
//     entry_price is the spread adjusted by the transaction cost
//     (Long pays up, Short receives less). size = invested / |spread|.
//     unrealized_pnl is recomputed on every mark-to-market from
//     last_spread; realized PnL is only known at the exit price.
//
//   Outcome-based (Fixed Horizon exits):
//     target_pnl is the gross PnL implied by the pre-labeled forward
//     outcome, known at entry. entry_cost holds the explicit fees deducted
//     when the position was opened. scheduled_close_date is set.
//     unrealized_pnl stays 0 (PnL resolves atomically at close).
//
// Ownership:
//   The PositionLedger owns the authoritative copy. Events and accessors
//   hand out copies or const pointers.
// -----------------------------------------------------------------------------
struct Position {
  std::string pair_id;
  Direction direction{Direction::Long};
  Date open_date{0};
  double invested_capital{0.0};
  double entry_cost{0.0};

  // Price-based fields
  double entry_spread{0.0};
  double entry_price{0.0};
  double size{0.0};
  double last_spread{0.0};
  double unrealized_pnl{0.0};

  // Outcome-based fields
  std::optional<Date> scheduled_close_date;
  double target_pnl{0.0};
};

}  // namespace domain
}  // namespace pairs
