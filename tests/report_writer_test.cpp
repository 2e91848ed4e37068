// =============================================================================
// report_writer_test.cpp
// =============================================================================
// Unit tests for the JSON report: record serialization, the equity table,
// the winner selection and the assembled document.
// =============================================================================

#include "pairs/domain/errors.hpp"
#include "pairs/report/report_writer.hpp"
#include "pairs/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <limits>
#include <string>
#include <vector>

using pairs::make_date;

namespace {

pairs::SimulationResult makeRun(const std::string& name, double final_equity) {
  pairs::SimulationResult r;
  r.variant = name;
  r.initial_capital = 10000.0;
  r.final_equity = final_equity;
  r.total_return = (final_equity - 10000.0) / 10000.0;

  pairs::domain::EquityPoint p;
  p.date = make_date(2024, 1, 8);
  p.equity = final_equity;
  r.equity_curve.push_back(p);

  pairs::domain::TradeRecord exit;
  exit.date = p.date;
  exit.pair_id = "KO_PEP";
  exit.event_type = pairs::domain::TradeEventType::Exit;
  exit.realized_pnl = final_equity - 10000.0;
  exit.close_reason = pairs::domain::CloseReason::EndOfBacktest;
  r.trades.push_back(exit);
  r.trade_count = 1;
  return r;
}

pairs::AggregateResult makeResult() {
  pairs::AggregateResult result;
  result.runs = {makeRun("Ridge", 10100.0), makeRun("LSTM", 10250.0),
                 makeRun("Hybrid", 10250.0)};
  for (const auto& run : result.runs) {
    pairs::VariantSummary s;
    s.name = run.variant;
    s.initial_capital = run.initial_capital;
    s.final_equity = run.final_equity;
    s.total_return = run.total_return;
    s.trade_count = run.trade_count;
    result.summaries.push_back(s);
  }
  result.table.variant_names = {"Ridge", "LSTM", "Hybrid"};
  pairs::EquityTable::Row row;
  row.date = make_date(2024, 1, 8);
  row.equity = {10100.0, std::numeric_limits<double>::quiet_NaN(), 10250.0};
  row.open_positions = {0, 0, 0};
  result.table.rows.push_back(row);
  return result;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Trade records use string enums and formatted dates; an Entry has a
//    null close reason.
// -----------------------------------------------------------------------------
TEST(ReportWriterTest, TradeRecordJson) {
  pairs::domain::TradeRecord t;
  t.date = make_date(2024, 1, 5);
  t.pair_id = "XOM_CVX";
  t.event_type = pairs::domain::TradeEventType::Entry;
  t.direction = pairs::domain::Direction::Short;
  t.price = 9.96;
  t.invested_capital = 1000.0;

  const auto j = pairs::tradeRecordToJson(t);
  EXPECT_EQ(j.at("date").get<std::string>(), "2024-01-05");
  EXPECT_EQ(j.at("event").get<std::string>(), "entry");
  EXPECT_EQ(j.at("direction").get<std::string>(), "SHORT");
  EXPECT_DOUBLE_EQ(j.at("price").get<double>(), 9.96);
  EXPECT_TRUE(j.at("close_reason").is_null());

  t.event_type = pairs::domain::TradeEventType::Exit;
  t.close_reason = pairs::domain::CloseReason::MeanReversion;
  EXPECT_EQ(pairs::tradeRecordToJson(t).at("close_reason").get<std::string>(),
            "Mean Reversion");
}

// -----------------------------------------------------------------------------
// 2. NaN cells in the equity table serialize as null.
// -----------------------------------------------------------------------------
TEST(ReportWriterTest, EquityTableNaNIsNull) {
  const auto j = pairs::equityTableToJson(makeResult().table);
  ASSERT_EQ(j.at("rows").size(), 1u);
  const auto& equity = j.at("rows")[0].at("equity");
  EXPECT_DOUBLE_EQ(equity[0].get<double>(), 10100.0);
  EXPECT_TRUE(equity[1].is_null());
  EXPECT_EQ(j.at("variants")[2].get<std::string>(), "Hybrid");
}

// -----------------------------------------------------------------------------
// 3. Winner: highest total PnL, ties go to the earlier variant.
// -----------------------------------------------------------------------------
TEST(ReportWriterTest, WinnerIndex) {
  EXPECT_EQ(pairs::winnerIndex(makeResult()), 1u);
}

// -----------------------------------------------------------------------------
// 4. The assembled report carries every section, with evaluations matched
//    to variants by name.
// -----------------------------------------------------------------------------
TEST(ReportWriterTest, BuildReport) {
  pairs::SignalEvaluation eval;
  eval.name = "LSTM";
  eval.total_trades = 4;
  eval.win_rate = 0.75;

  const auto j =
      pairs::buildReport(pairs::BacktestConfig{}, makeResult(), {eval});

  EXPECT_EQ(j.at("winner").get<std::string>(), "LSTM");
  EXPECT_EQ(j.at("config").at("exit_policy").get<std::string>(),
            "signal_reversal");

  const auto& variants = j.at("variants");
  ASSERT_EQ(variants.size(), 3u);
  EXPECT_TRUE(variants[0].at("evaluation").is_null());
  EXPECT_DOUBLE_EQ(variants[1].at("evaluation").at("win_rate").get<double>(),
                   0.75);
  EXPECT_EQ(variants[1].at("summary").at("name").get<std::string>(), "LSTM");
  EXPECT_DOUBLE_EQ(
      variants[1].at("performance").at("total_pnl").get<double>(), 250.0);
  ASSERT_EQ(variants[1].at("trades").size(), 1u);
  EXPECT_EQ(variants[1].at("trades")[0].at("close_reason").get<std::string>(),
            "End of Backtest");
  EXPECT_EQ(j.at("equity").at("rows").size(), 1u);
}

TEST(ReportWriterTest, UnwritablePathThrows) {
  EXPECT_THROW(pairs::writeReport("/nonexistent/dir/report.json",
                                  pairs::BacktestConfig{}, makeResult(), {}),
               pairs::BacktestError);
}
