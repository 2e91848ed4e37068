// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for BacktestConfig::validate() and the JSON config loader.
// =============================================================================

#include "pairs/config/backtest_config.hpp"
#include "pairs/config/config_loader.hpp"
#include "pairs/domain/errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using nlohmann::json;

// -----------------------------------------------------------------------------
// 1. Defaults are valid and match the documented values.
// -----------------------------------------------------------------------------
TEST(BacktestConfigTest, DefaultsAreValid) {
  pairs::BacktestConfig c;
  EXPECT_NO_THROW(c.validate());
  EXPECT_DOUBLE_EQ(c.initial_capital, 10000.0);
  EXPECT_DOUBLE_EQ(c.capital_per_trade, 1000.0);
  EXPECT_EQ(c.max_positions, 3u);
  EXPECT_DOUBLE_EQ(c.capital_buffer, 1.1);
  EXPECT_DOUBLE_EQ(c.entry_z_threshold, 1.5);
  EXPECT_DOUBLE_EQ(c.exit_z_threshold, 0.5);
  EXPECT_DOUBLE_EQ(c.model_confidence, 0.55);
  EXPECT_EQ(c.hold_period, 10);
  EXPECT_EQ(c.exit_policy, pairs::ExitPolicyKind::SignalReversal);
}

// -----------------------------------------------------------------------------
// 2. Unset risk percent depends on the exit policy: signal reversal sizes
//     at 2% of realized equity, fixed horizon commits capital_per_trade.
//     An explicit value, including 0, always wins.
// -----------------------------------------------------------------------------
TEST(BacktestConfigTest, RiskPercentDefaultsByExitPolicy) {
  pairs::BacktestConfig c;
  EXPECT_FALSE(c.position_risk_pct.has_value());
  EXPECT_DOUBLE_EQ(c.riskPct(), 0.02);

  c.exit_policy = pairs::ExitPolicyKind::FixedHorizon;
  EXPECT_DOUBLE_EQ(c.riskPct(), 0.0);

  c.position_risk_pct = 0.05;
  EXPECT_DOUBLE_EQ(c.riskPct(), 0.05);

  c.exit_policy = pairs::ExitPolicyKind::SignalReversal;
  c.position_risk_pct = 0.0;
  EXPECT_DOUBLE_EQ(c.riskPct(), 0.0);
  EXPECT_NO_THROW(c.validate());

  c.position_risk_pct = 1.0;
  EXPECT_THROW(c.validate(), pairs::ConfigError);

  // The JSON form records the effective value.
  pairs::BacktestConfig d;
  EXPECT_DOUBLE_EQ(
      pairs::backtestConfigToJson(d).at("position_risk_pct").get<double>(),
      0.02);
}

// -----------------------------------------------------------------------------
// 3. Each range rule rejects an out-of-range value with a named field.
// -----------------------------------------------------------------------------
TEST(BacktestConfigTest, RangeRules) {
  auto expectInvalid = [](pairs::BacktestConfig c, const std::string& field) {
    try {
      c.validate();
      ADD_FAILURE() << "expected ConfigError for " << field;
    } catch (const pairs::ConfigError& e) {
      EXPECT_NE(std::string(e.what()).find(field), std::string::npos)
          << e.what();
    }
  };

  pairs::BacktestConfig c;
  c.initial_capital = 0.0;
  expectInvalid(c, "initial_capital");

  c = {};
  c.capital_buffer = 0.9;
  expectInvalid(c, "capital_buffer");

  c = {};
  c.exit_z_threshold = 1.5;
  expectInvalid(c, "exit_z_threshold");

  c = {};
  c.model_confidence = 0.4;
  expectInvalid(c, "model_confidence");

  c = {};
  c.transaction_cost_pct = -0.01;
  expectInvalid(c, "transaction_cost_pct");

  c = {};
  c.hold_period = 0;
  expectInvalid(c, "hold_period");

  c = {};
  c.max_positions = 0;
  expectInvalid(c, "max_positions");
}

// -----------------------------------------------------------------------------
// 4. An empty document yields defaults and no variants.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, EmptyObjectGivesDefaults) {
  const auto run = pairs::runConfigFromJson(json::object());
  EXPECT_DOUBLE_EQ(run.backtest.initial_capital, 10000.0);
  EXPECT_TRUE(run.variants.empty());
  EXPECT_FALSE(run.parallel);
}

// -----------------------------------------------------------------------------
// 5. A full document round-trips every field it sets.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, ParsesFullDocument) {
  const auto doc = json::parse(R"({
    "backtest": {
      "initial_capital": 50000,
      "position_risk_pct": 0.02,
      "max_positions": 5,
      "exit_policy": "fixed_horizon",
      "hold_period": 7,
      "commission": 1.0,
      "entry_z_threshold": 2.0,
      "exit_z_threshold": 0.25
    },
    "variants": [
      { "name": "Ridge",  "models": ["Ridge"] },
      { "name": "Hybrid", "models": ["Ridge", "LSTM"] }
    ],
    "parallel": true
  })");

  const auto run = pairs::runConfigFromJson(doc);
  EXPECT_DOUBLE_EQ(run.backtest.initial_capital, 50000.0);
  ASSERT_TRUE(run.backtest.position_risk_pct.has_value());
  EXPECT_DOUBLE_EQ(run.backtest.riskPct(), 0.02);
  EXPECT_EQ(run.backtest.max_positions, 5u);
  EXPECT_EQ(run.backtest.exit_policy, pairs::ExitPolicyKind::FixedHorizon);
  EXPECT_EQ(run.backtest.hold_period, 7);
  EXPECT_DOUBLE_EQ(run.backtest.commission, 1.0);
  EXPECT_DOUBLE_EQ(run.backtest.capital_per_trade, 1000.0);  // untouched

  ASSERT_EQ(run.variants.size(), 2u);
  EXPECT_EQ(run.variants[1].name, "Hybrid");
  EXPECT_EQ(run.variants[1].models,
            (std::vector<std::string>{"Ridge", "LSTM"}));
  EXPECT_TRUE(run.parallel);

  const auto back = pairs::backtestConfigToJson(run.backtest);
  EXPECT_EQ(back.at("exit_policy").get<std::string>(), "fixed_horizon");
  EXPECT_EQ(back.at("max_positions").get<int>(), 5);
  EXPECT_DOUBLE_EQ(back.at("exit_z_threshold").get<double>(), 0.25);
}

// -----------------------------------------------------------------------------
// 6. Invalid documents raise ConfigError.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, RejectsInvalidDocuments) {
  EXPECT_THROW(pairs::runConfigFromJson(json::array()), pairs::ConfigError);

  EXPECT_THROW(pairs::runConfigFromJson(
                   json::parse(R"({"backtest": {"exit_policy": "trailing"}})")),
               pairs::ConfigError);

  EXPECT_THROW(pairs::runConfigFromJson(
                   json::parse(R"({"backtest": {"max_positions": -1}})")),
               pairs::ConfigError);

  EXPECT_THROW(pairs::runConfigFromJson(
                   json::parse(R"({"backtest": {"model_confidence": 0.3}})")),
               pairs::ConfigError);

  EXPECT_THROW(pairs::runConfigFromJson(json::parse(
                   R"({"variants": [{"name": "Empty", "models": []}]})")),
               pairs::ConfigError);

  EXPECT_THROW(pairs::runConfigFromJson(json::parse(
                   R"({"variants": [{"name": "", "models": ["Ridge"]}]})")),
               pairs::ConfigError);
}

TEST(ConfigLoaderTest, MissingFile) {
  EXPECT_THROW(pairs::loadRunConfig("/nonexistent/config.json"),
               pairs::ConfigError);
}
