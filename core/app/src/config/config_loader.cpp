#include "pairs/config/config_loader.hpp"
#include "pairs/domain/errors.hpp"

#include <fstream>

namespace pairs {

namespace {

// Copies doc[key] into `out` when present; leaves the default otherwise.
template <typename T>
void readOptional(const nlohmann::json& doc, const char* key, T& out) {
  auto it = doc.find(key);
  if (it != doc.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

ExitPolicyKind parseExitPolicy(const std::string& name) {
  if (name == "signal_reversal") {
    return ExitPolicyKind::SignalReversal;
  }
  if (name == "fixed_horizon") {
    return ExitPolicyKind::FixedHorizon;
  }
  throw ConfigError("unknown exit_policy '" + name +
                    "' (expected signal_reversal or fixed_horizon)");
}

BacktestConfig backtestFromJson(const nlohmann::json& j) {
  BacktestConfig c;
  readOptional(j, "initial_capital", c.initial_capital);
  readOptional(j, "capital_per_trade", c.capital_per_trade);
  auto risk = j.find("position_risk_pct");
  if (risk != j.end() && !risk->is_null()) {
    c.position_risk_pct = risk->get<double>();
  }
  // Read signed so a negative value is reported instead of wrapping.
  long long max_positions = static_cast<long long>(c.max_positions);
  readOptional(j, "max_positions", max_positions);
  if (max_positions < 1) {
    throw ConfigError("max_positions must be >= 1 (got " +
                      std::to_string(max_positions) + ")");
  }
  c.max_positions = static_cast<std::size_t>(max_positions);
  readOptional(j, "capital_buffer", c.capital_buffer);
  readOptional(j, "transaction_cost_pct", c.transaction_cost_pct);
  readOptional(j, "commission", c.commission);
  readOptional(j, "slippage_pct", c.slippage_pct);
  readOptional(j, "spread_pct", c.spread_pct);
  readOptional(j, "annual_borrow_rate", c.annual_borrow_rate);
  readOptional(j, "entry_z_threshold", c.entry_z_threshold);
  readOptional(j, "exit_z_threshold", c.exit_z_threshold);
  readOptional(j, "model_confidence", c.model_confidence);
  readOptional(j, "hold_period", c.hold_period);

  std::string policy;
  readOptional(j, "exit_policy", policy);
  if (!policy.empty()) {
    c.exit_policy = parseExitPolicy(policy);
  }
  return c;
}

}  // namespace

RunConfig runConfigFromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  RunConfig run;
  if (auto it = doc.find("backtest"); it != doc.end()) {
    run.backtest = backtestFromJson(*it);
  }
  run.backtest.validate();

  if (auto it = doc.find("variants"); it != doc.end()) {
    for (const auto& v : *it) {
      StrategyVariant variant;
      variant.name = v.at("name").get<std::string>();
      variant.models = v.at("models").get<std::vector<std::string>>();
      if (variant.name.empty()) {
        throw ConfigError("strategy variant with empty name");
      }
      if (variant.models.empty()) {
        throw ConfigError("strategy variant '" + variant.name +
                          "' lists no models");
      }
      run.variants.push_back(std::move(variant));
    }
  }

  readOptional(doc, "parallel", run.parallel);
  return run;
}

RunConfig loadRunConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file: " + path);
  }
  nlohmann::json doc = nlohmann::json::parse(in);
  return runConfigFromJson(doc);
}

nlohmann::json backtestConfigToJson(const BacktestConfig& c) {
  nlohmann::json j;
  j["initial_capital"] = c.initial_capital;
  j["capital_per_trade"] = c.capital_per_trade;
  j["position_risk_pct"] = c.riskPct();
  j["max_positions"] = c.max_positions;
  j["capital_buffer"] = c.capital_buffer;
  j["transaction_cost_pct"] = c.transaction_cost_pct;
  j["commission"] = c.commission;
  j["slippage_pct"] = c.slippage_pct;
  j["spread_pct"] = c.spread_pct;
  j["annual_borrow_rate"] = c.annual_borrow_rate;
  j["entry_z_threshold"] = c.entry_z_threshold;
  j["exit_z_threshold"] = c.exit_z_threshold;
  j["model_confidence"] = c.model_confidence;
  j["exit_policy"] = exitPolicyKindToString(c.exit_policy);
  j["hold_period"] = c.hold_period;
  return j;
}

}  // namespace pairs
