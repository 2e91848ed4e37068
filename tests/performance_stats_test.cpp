// =============================================================================
// performance_stats_test.cpp
// =============================================================================
// Unit tests for pairs::computePerformance().
// =============================================================================

#include "pairs/analysis/performance_stats.hpp"
#include "pairs/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

pairs::domain::EquityPoint point(unsigned day, double equity) {
  pairs::domain::EquityPoint p;
  p.date = pairs::make_date(2024, 1, day);
  p.equity = equity;
  return p;
}

pairs::domain::TradeRecord exitWith(double pnl) {
  pairs::domain::TradeRecord t;
  t.event_type = pairs::domain::TradeEventType::Exit;
  t.realized_pnl = pnl;
  return t;
}

pairs::domain::TradeRecord entry() {
  pairs::domain::TradeRecord t;
  t.event_type = pairs::domain::TradeEventType::Entry;
  return t;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Equity extremes, drawdown from the running peak, and return.
// -----------------------------------------------------------------------------
TEST(PerformanceStatsTest, EquityStatistics) {
  const std::vector<pairs::domain::EquityPoint> curve = {
      point(8, 10500.0), point(9, 11000.0), point(10, 9900.0),
      point(11, 10200.0)};

  const auto s = pairs::computePerformance(curve, {}, 10000.0, 10500.0);

  EXPECT_DOUBLE_EQ(s.final_equity, 10500.0);
  EXPECT_DOUBLE_EQ(s.total_return_pct, 5.0);
  EXPECT_DOUBLE_EQ(s.max_equity, 11000.0);
  EXPECT_DOUBLE_EQ(s.min_equity, 9900.0);
  EXPECT_DOUBLE_EQ(s.max_drawdown_pct, -10.0);
}

// -----------------------------------------------------------------------------
// 2. A drawdown below the starting capital counts from the initial peak.
// -----------------------------------------------------------------------------
TEST(PerformanceStatsTest, DrawdownFromInitialCapital) {
  const std::vector<pairs::domain::EquityPoint> curve = {point(8, 9500.0),
                                                         point(9, 9800.0)};
  const auto s = pairs::computePerformance(curve, {}, 10000.0, 9800.0);
  EXPECT_DOUBLE_EQ(s.max_drawdown_pct, -5.0);
  EXPECT_DOUBLE_EQ(s.min_equity, 9500.0);
  EXPECT_DOUBLE_EQ(s.total_return_pct, -2.0);
}

// -----------------------------------------------------------------------------
// 3. Trade statistics use Exit records only; break-even is neither.
// -----------------------------------------------------------------------------
TEST(PerformanceStatsTest, TradeStatistics) {
  const std::vector<pairs::domain::TradeRecord> trades = {
      entry(), exitWith(100.0), entry(), exitWith(-50.0),
      entry(), exitWith(0.0),   entry(), exitWith(40.0)};

  const auto s = pairs::computePerformance({}, trades, 10000.0, 10090.0);

  EXPECT_EQ(s.total_trades, 4u);
  EXPECT_EQ(s.winning_trades, 2u);
  EXPECT_EQ(s.losing_trades, 1u);
  EXPECT_DOUBLE_EQ(s.win_rate_pct, 50.0);
  EXPECT_DOUBLE_EQ(s.avg_win, 70.0);
  EXPECT_DOUBLE_EQ(s.avg_loss, -50.0);
  EXPECT_DOUBLE_EQ(s.total_pnl, 90.0);
}

// -----------------------------------------------------------------------------
// 4. No activity: flat equity and zeroed trade statistics.
// -----------------------------------------------------------------------------
TEST(PerformanceStatsTest, NoActivity) {
  const auto s = pairs::computePerformance({}, {}, 10000.0, 10000.0);
  EXPECT_DOUBLE_EQ(s.total_return_pct, 0.0);
  EXPECT_DOUBLE_EQ(s.max_drawdown_pct, 0.0);
  EXPECT_EQ(s.total_trades, 0u);
  EXPECT_DOUBLE_EQ(s.win_rate_pct, 0.0);
  EXPECT_DOUBLE_EQ(s.avg_win, 0.0);
  EXPECT_DOUBLE_EQ(s.avg_loss, 0.0);
}
