#pragma once

#include "pairs/config/backtest_config.hpp"
#include "pairs/signal/signal_stream.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pairs {

// -----------------------------------------------------------------------------
// SignalEvaluation — static hit-rate of one variant's entry signals
// -----------------------------------------------------------------------------
// Rates are fractions in [0, 1]; 0 when the corresponding trade count is 0.
// -----------------------------------------------------------------------------
struct SignalEvaluation {
  std::string name;
  std::size_t total_trades{0};
  std::size_t long_trades{0};
  std::size_t short_trades{0};
  double win_rate{0.0};
  double long_win_rate{0.0};
  double short_win_rate{0.0};
};

// -------------------------------------------------------------------------
// evaluateSignals(stream, config, variants)
// -------------------------------------------------------------------------
// @brief  Counts, without any capital or position state, how often each
//         variant's entry rule picked the right direction.
//
// @details
// Every row whose EntryRule fires is one trade (no concurrency limit, no
// one-position-per-pair rule). A Long wins when target_direction == 1, a
// Short when target_direction == 0.
//
// Throws: SignalValidationError if a variant names an unknown model or
//         the rows fail the base validation.
// -------------------------------------------------------------------------
std::vector<SignalEvaluation> evaluateSignals(
    const SignalStream& stream, const BacktestConfig& config,
    const std::vector<StrategyVariant>& variants);

}  // namespace pairs
