// =============================================================================
// signal_evaluator_test.cpp
// =============================================================================
// Unit tests for pairs::evaluateSignals(): static hit rates with no capital
// or position constraints.
// =============================================================================

#include "pairs/analysis/signal_evaluator.hpp"
#include "pairs/domain/errors.hpp"
#include "pairs/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using pairs::make_date;

namespace {

pairs::domain::SignalRow makeRow(unsigned day, const std::string& pair,
                                 double z, double ridge, double lstm,
                                 int target_direction) {
  pairs::domain::SignalRow row;
  row.date = make_date(2024, 1, day);
  row.pair_id = pair;
  row.z_score = z;
  row.predictions = {ridge, lstm};
  row.target_return = 0.0;
  row.target_direction = target_direction;
  return row;
}

}  // namespace

class SignalEvaluatorTest : public ::testing::Test {
 protected:
  pairs::BacktestConfig config;
  std::vector<pairs::StrategyVariant> variants = {
      {"Ridge", {"Ridge"}}, {"LSTM", {"LSTM"}}, {"Hybrid", {"Ridge", "LSTM"}}};

  // Same pair on consecutive days: the evaluator ignores position state,
  // so every firing row counts.
  pairs::SignalStream stream{
      {"Ridge", "LSTM"},
      {makeRow(8, "A_B", -2.0, 0.9, 0.9, 1),    // Long, right (both)
       makeRow(9, "A_B", -2.0, 0.9, 0.2, 0),    // Long, wrong (Ridge only)
       makeRow(10, "A_B", 2.0, 0.1, 0.1, 0),    // Short, right (both)
       makeRow(11, "A_B", 2.0, 0.1, 0.9, 1),    // Short, wrong (Ridge only)
       makeRow(12, "A_B", 2.0, 0.3, 0.3, 0),    // Short, right (both)
       makeRow(12, "C_D", 0.4, 0.9, 0.9, 1)}};  // no signal
};

// -----------------------------------------------------------------------------
// 1. Per-variant counts and win rates, in variant order.
// -----------------------------------------------------------------------------
TEST_F(SignalEvaluatorTest, WinRatesPerVariant) {
  const auto evals = pairs::evaluateSignals(stream, config, variants);
  ASSERT_EQ(evals.size(), 3u);

  const auto& ridge = evals[0];
  EXPECT_EQ(ridge.name, "Ridge");
  EXPECT_EQ(ridge.total_trades, 5u);
  EXPECT_EQ(ridge.long_trades, 2u);
  EXPECT_EQ(ridge.short_trades, 3u);
  EXPECT_DOUBLE_EQ(ridge.win_rate, 3.0 / 5.0);
  EXPECT_DOUBLE_EQ(ridge.long_win_rate, 0.5);
  EXPECT_DOUBLE_EQ(ridge.short_win_rate, 2.0 / 3.0);

  // LSTM fires on days 8, 10, 12 only (day 9 prediction too low, day 11
  // too high), all right.
  const auto& lstm = evals[1];
  EXPECT_EQ(lstm.total_trades, 3u);
  EXPECT_DOUBLE_EQ(lstm.win_rate, 1.0);

  // Consensus: fires only where both agree.
  const auto& hybrid = evals[2];
  EXPECT_EQ(hybrid.total_trades, 3u);
  EXPECT_EQ(hybrid.long_trades, 1u);
  EXPECT_EQ(hybrid.short_trades, 2u);
  EXPECT_DOUBLE_EQ(hybrid.win_rate, 1.0);
}

// -----------------------------------------------------------------------------
// 2. No firing rows: rates are 0, not NaN.
// -----------------------------------------------------------------------------
TEST_F(SignalEvaluatorTest, NoSignalsGiveZeroRates) {
  config.entry_z_threshold = 5.0;
  config.exit_z_threshold = 0.5;
  const auto evals = pairs::evaluateSignals(stream, config, variants);
  for (const auto& e : evals) {
    EXPECT_EQ(e.total_trades, 0u);
    EXPECT_DOUBLE_EQ(e.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(e.long_win_rate, 0.0);
    EXPECT_DOUBLE_EQ(e.short_win_rate, 0.0);
  }
}

TEST_F(SignalEvaluatorTest, UnknownModelThrows) {
  const std::vector<pairs::StrategyVariant> bad = {{"GBM", {"GBM"}}};
  EXPECT_THROW(pairs::evaluateSignals(stream, config, bad),
               pairs::SignalValidationError);
}
