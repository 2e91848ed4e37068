#pragma once

#include "pairs/config/backtest_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace pairs {

// -----------------------------------------------------------------------------
// JSON configuration
// -----------------------------------------------------------------------------
//
// Expected document (every key optional):
//
//   {
//     "backtest": {
//       "initial_capital": 10000, "capital_per_trade": 1000,
//       "position_risk_pct": 0.02, "max_positions": 3, "capital_buffer": 1.1,
//       "transaction_cost_pct": 0.004, "commission": 2.0,
//       "slippage_pct": 0.0005, "spread_pct": 0.0005,
//       "annual_borrow_rate": 0.03,
//       "entry_z_threshold": 1.5, "exit_z_threshold": 0.5,
//       "model_confidence": 0.55,
//       "exit_policy": "signal_reversal" | "fixed_horizon",
//       "hold_period": 10
//     },
//     "variants": [ {"name": "LSTM", "models": ["LSTM"]},
//                   {"name": "Hybrid", "models": ["LSTM", "Ridge"]} ],
//     "parallel": false
//   }
//
// Missing keys keep BacktestConfig's defaults. Wrong JSON types surface as
// nlohmann::json::type_error; semantic problems (unknown exit_policy,
// variant without models, out-of-range values) as ConfigError.
// -----------------------------------------------------------------------------

RunConfig runConfigFromJson(const nlohmann::json& doc);

// Reads and parses `path`. Throws ConfigError if the file cannot be opened
// and nlohmann::json::parse_error on malformed JSON.
RunConfig loadRunConfig(const std::string& path);

// Serializes the backtest section (used by the JSON report).
nlohmann::json backtestConfigToJson(const BacktestConfig& config);

}  // namespace pairs
