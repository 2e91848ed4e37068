#include "pairs/config/backtest_config.hpp"
#include "pairs/domain/errors.hpp"

#include <cmath>
#include <sstream>

namespace pairs {

namespace {

void require(bool condition, const char* field, double value,
             const char* rule) {
  if (condition) {
    return;
  }
  std::ostringstream os;
  os << field << " must be " << rule << " (got " << value << ")";
  throw ConfigError(os.str());
}

bool finite(double v) { return std::isfinite(v); }

}  // namespace

const char* exitPolicyKindToString(ExitPolicyKind kind) {
  switch (kind) {
    case ExitPolicyKind::SignalReversal: return "signal_reversal";
    case ExitPolicyKind::FixedHorizon:   return "fixed_horizon";
  }
  return "unknown";
}

double BacktestConfig::riskPct() const {
  if (position_risk_pct) {
    return *position_risk_pct;
  }
  return exit_policy == ExitPolicyKind::SignalReversal ? kSignalReversalRiskPct
                                                       : 0.0;
}

void BacktestConfig::validate() const {
  require(finite(initial_capital) && initial_capital > 0.0,
          "initial_capital", initial_capital, "> 0");
  require(finite(capital_per_trade) && capital_per_trade > 0.0,
          "capital_per_trade", capital_per_trade, "> 0");
  require(riskPct() >= 0.0 && riskPct() < 1.0, "position_risk_pct",
          riskPct(), "in [0, 1)");
  require(max_positions >= 1, "max_positions",
          static_cast<double>(max_positions), ">= 1");
  require(finite(capital_buffer) && capital_buffer >= 1.0, "capital_buffer",
          capital_buffer, ">= 1");

  require(transaction_cost_pct >= 0.0 && transaction_cost_pct < 1.0,
          "transaction_cost_pct", transaction_cost_pct, "in [0, 1)");
  require(finite(commission) && commission >= 0.0, "commission", commission,
          ">= 0");
  require(slippage_pct >= 0.0 && slippage_pct < 1.0, "slippage_pct",
          slippage_pct, "in [0, 1)");
  require(spread_pct >= 0.0 && spread_pct < 1.0, "spread_pct", spread_pct,
          "in [0, 1)");
  require(finite(annual_borrow_rate) && annual_borrow_rate >= 0.0,
          "annual_borrow_rate", annual_borrow_rate, ">= 0");

  require(finite(entry_z_threshold) && entry_z_threshold > 0.0,
          "entry_z_threshold", entry_z_threshold, "> 0");
  require(exit_z_threshold >= 0.0 && exit_z_threshold < entry_z_threshold,
          "exit_z_threshold", exit_z_threshold,
          ">= 0 and < entry_z_threshold");
  require(model_confidence >= 0.5 && model_confidence < 1.0,
          "model_confidence", model_confidence, "in [0.5, 1)");
  require(hold_period >= 1, "hold_period", hold_period, ">= 1");
}

}  // namespace pairs
