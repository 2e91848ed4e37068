#pragma once

#include "pairs/domain/equity_point.hpp"
#include "pairs/domain/trade_record.hpp"

#include <cstddef>
#include <vector>

namespace pairs {

// -----------------------------------------------------------------------------
// PerformanceStats — post-run statistics over one variant's output
// -----------------------------------------------------------------------------
//
// Percentages are in percent units (12.5 means 12.5%).
//
//   total_return_pct  (final − initial) / initial × 100
//   max_drawdown_pct  largest peak-to-trough decline of the equity curve,
//                     measured from the running peak (initial capital
//                     counts as the first peak); reported as a value <= 0.
//   win/loss          Exit records with realized_pnl > 0 / < 0; break-even
//                     exits count toward total_trades only.
// -----------------------------------------------------------------------------
struct PerformanceStats {
  double final_equity{0.0};
  double total_return_pct{0.0};
  double max_equity{0.0};
  double min_equity{0.0};
  double max_drawdown_pct{0.0};
  std::size_t total_trades{0};
  std::size_t winning_trades{0};
  std::size_t losing_trades{0};
  double win_rate_pct{0.0};
  double avg_win{0.0};
  double avg_loss{0.0};
  double total_pnl{0.0};
};

// -------------------------------------------------------------------------
// computePerformance(equity_curve, trades, initial_capital, final_equity)
// -------------------------------------------------------------------------
// @param  final_equity  Equity after the run (SimulationResult::final_equity).
//                       Included in max/min and drawdown so force-closed
//                       outcome-based PnL is not lost.
//
// An empty curve and no trades yields final_equity, 0% return and zeroed
// trade statistics.
// -------------------------------------------------------------------------
PerformanceStats computePerformance(
    const std::vector<domain::EquityPoint>& equity_curve,
    const std::vector<domain::TradeRecord>& trades, double initial_capital,
    double final_equity);

}  // namespace pairs
