#include "pairs/analysis/performance_stats.hpp"

#include <algorithm>

namespace pairs {

PerformanceStats computePerformance(
    const std::vector<domain::EquityPoint>& equity_curve,
    const std::vector<domain::TradeRecord>& trades, double initial_capital,
    double final_equity) {
  PerformanceStats s;
  s.final_equity = final_equity;
  if (initial_capital > 0.0) {
    s.total_return_pct =
        (final_equity - initial_capital) / initial_capital * 100.0;
  }

  // Equity path: initial capital, every recorded point, final equity.
  std::vector<double> path;
  path.reserve(equity_curve.size() + 2);
  path.push_back(initial_capital);
  for (const auto& p : equity_curve) {
    path.push_back(p.equity);
  }
  path.push_back(final_equity);

  s.max_equity = *std::max_element(path.begin(), path.end());
  s.min_equity = *std::min_element(path.begin(), path.end());

  double peak = path.front();
  for (double e : path) {
    peak = std::max(peak, e);
    if (peak > 0.0) {
      s.max_drawdown_pct = std::min(s.max_drawdown_pct, (e - peak) / peak * 100.0);
    }
  }

  double win_sum = 0.0;
  double loss_sum = 0.0;
  for (const auto& t : trades) {
    if (t.event_type != domain::TradeEventType::Exit) {
      continue;
    }
    ++s.total_trades;
    s.total_pnl += t.realized_pnl;
    if (t.realized_pnl > 0.0) {
      ++s.winning_trades;
      win_sum += t.realized_pnl;
    } else if (t.realized_pnl < 0.0) {
      ++s.losing_trades;
      loss_sum += t.realized_pnl;
    }
  }

  if (s.total_trades > 0) {
    s.win_rate_pct = static_cast<double>(s.winning_trades) /
                     static_cast<double>(s.total_trades) * 100.0;
  }
  if (s.winning_trades > 0) {
    s.avg_win = win_sum / static_cast<double>(s.winning_trades);
  }
  if (s.losing_trades > 0) {
    s.avg_loss = loss_sum / static_cast<double>(s.losing_trades);
  }
  return s;
}

}  // namespace pairs
