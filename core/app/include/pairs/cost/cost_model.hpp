#pragma once

#include "pairs/config/backtest_config.hpp"
#include "pairs/domain/direction.hpp"

namespace pairs {

// -----------------------------------------------------------------------------
// CostBreakdown
// -----------------------------------------------------------------------------
// Explicit fee components of one round-trip trade. total() is what the
// PositionLedger deducts at entry for outcome-based positions.
// -----------------------------------------------------------------------------
struct CostBreakdown {
  double commission{0.0};
  double slippage{0.0};
  double spread{0.0};
  double borrow{0.0};  // Shorts only

  double total() const { return commission + slippage + spread + borrow; }
};

// Which side of a round trip a price adjustment applies to.
enum class PriceLeg {
  Entry,
  Exit,
};

// -----------------------------------------------------------------------------
// CostModel — transaction cost policy
// -----------------------------------------------------------------------------
//
// @brief  Pure functions of their inputs; holds only the rates copied from
//         BacktestConfig.
//
// @details
// Two representations, chosen by the engine's PnL mode:
//
//   1. Explicit fees (outcome-based engines), cost():
//        commission
//      + capital * slippage_pct
//      + capital * spread_pct
//      + capital * annual_borrow_rate * holding_days / 365   (Short only)
//
//   2. Price adjustment (price-based engines), adjustedPrice():
//        Long  entry  → price marked up   by |price| * transaction_cost_pct
//        Long  exit   → price marked down
//        Short entry  → price marked down
//        Short exit   → price marked up
//      The cost lands in PnL through worse fills instead of a separate
//      ledger deduction. The adjustment uses |price| so that negative
//      spreads are still penalized in the trader's disfavor.
//
// Thread-safety: Immutable after construction; safe to share.
// -----------------------------------------------------------------------------
class CostModel {
 public:
  explicit CostModel(const BacktestConfig& config);

  // -------------------------------------------------------------------------
  // cost(direction, capital, holding_days)
  // -------------------------------------------------------------------------
  // @param  direction     Long or Short. Only Short pays borrow.
  // @param  capital       Capital committed to the trade.
  // @param  holding_days  Calendar days the position is expected to be held.
  //                       Negative values are treated as 0.
  // -------------------------------------------------------------------------
  CostBreakdown cost(domain::Direction direction, double capital,
                     int holding_days) const;

  // Cost-adjusted fill price for one leg of a price-based trade.
  double adjustedPrice(double price, domain::Direction direction,
                       PriceLeg leg) const;

 private:
  double commission_;
  double slippage_pct_;
  double spread_pct_;
  double annual_borrow_rate_;
  double transaction_cost_pct_;
};

}  // namespace pairs
