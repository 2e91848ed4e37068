#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pairs {

// Which exit rule closes positions. The choice also fixes the PnL
// representation: SignalReversal is price-based, FixedHorizon is
// outcome-based (see domain::Position).
enum class ExitPolicyKind {
  SignalReversal,
  FixedHorizon,
};

const char* exitPolicyKindToString(ExitPolicyKind kind);

// -----------------------------------------------------------------------------
// BacktestConfig — every tunable of a simulation run in one place
// -----------------------------------------------------------------------------
//
// @brief  Plain data struct with defaults. Copied by value into the
//         SimulationEngine and everything it owns; constant for the
//         lifetime of a run.
//
// @details
// Capital sizing (riskPct() is the effective percentage):
//   riskPct() == 0 → every entry commits capital_per_trade.
//   riskPct()  > 0 → every entry commits realized equity × pct,
//                    so position size compounds with results.
// Left unset, position_risk_pct defaults by exit policy: 2% of realized
// equity for SignalReversal, fixed capital_per_trade for FixedHorizon.
//
// Entry capital check:
//   An entry is skipped when available capital is below
//   capital × capital_buffer. The buffer (>= 1) keeps room for fees.
//
// Costs:
//   transaction_cost_pct        → price adjustment, price-based engines.
//   commission / slippage_pct /
//   spread_pct / annual_borrow_rate → explicit fees, outcome-based engines.
//
// validate() enforces the value ranges and throws ConfigError; it is
// called by SimulationEngine's constructor so no run starts with an
// inconsistent configuration.
// -----------------------------------------------------------------------------
struct BacktestConfig {
  // --- Capital -------------------------------------------------------------
  double initial_capital{10000.0};
  double capital_per_trade{1000.0};
  std::optional<double> position_risk_pct;
  std::size_t max_positions{3};
  double capital_buffer{1.1};

  // --- Costs ---------------------------------------------------------------
  double transaction_cost_pct{0.004};
  double commission{2.0};
  double slippage_pct{0.0005};
  double spread_pct{0.0005};
  double annual_borrow_rate{0.03};

  // --- Signal thresholds ---------------------------------------------------
  double entry_z_threshold{1.5};
  double exit_z_threshold{0.5};
  double model_confidence{0.55};

  // --- Exit policy ---------------------------------------------------------
  ExitPolicyKind exit_policy{ExitPolicyKind::SignalReversal};
  int hold_period{10};  // trading days, FixedHorizon only

  static constexpr double kSignalReversalRiskPct = 0.02;

  double riskPct() const;
  void validate() const;
};

// -----------------------------------------------------------------------------
// StrategyVariant
// -----------------------------------------------------------------------------
// A named entry filter: the listed models must all agree on direction.
// One model → single-model strategy; several → consensus/hybrid.
// Model names refer to SignalStream::modelNames().
// -----------------------------------------------------------------------------
struct StrategyVariant {
  std::string name;
  std::vector<std::string> models;
};

// Everything the CLI needs for one invocation.
struct RunConfig {
  BacktestConfig backtest;
  std::vector<StrategyVariant> variants;
  bool parallel{false};
};

}  // namespace pairs
