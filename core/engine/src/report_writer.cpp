#include "pairs/report/report_writer.hpp"
#include "pairs/config/config_loader.hpp"
#include "pairs/domain/errors.hpp"
#include "pairs/time/time_utils.hpp"

#include <cmath>
#include <fstream>

namespace pairs {

namespace {

nlohmann::json finiteOrNull(double v) {
  if (std::isfinite(v)) {
    return v;
  }
  return nullptr;
}

}  // namespace

nlohmann::json tradeRecordToJson(const domain::TradeRecord& t) {
  nlohmann::json j;
  j["date"] = format_date(t.date);
  j["pair_id"] = t.pair_id;
  j["event"] = domain::tradeEventTypeToString(t.event_type);
  j["direction"] = domain::directionToString(t.direction);
  j["price"] = finiteOrNull(t.price);
  j["invested_capital"] = t.invested_capital;
  j["cost"] = t.cost;
  j["realized_pnl"] = t.realized_pnl;
  j["pnl_pct"] = finiteOrNull(t.pnl_pct);
  if (t.close_reason) {
    j["close_reason"] = domain::closeReasonToString(*t.close_reason);
  } else {
    j["close_reason"] = nullptr;
  }
  return j;
}

nlohmann::json equityTableToJson(const EquityTable& table) {
  nlohmann::json j;
  j["variants"] = table.variant_names;
  auto rows = nlohmann::json::array();
  for (const auto& r : table.rows) {
    nlohmann::json row;
    row["date"] = format_date(r.date);
    auto equity = nlohmann::json::array();
    for (double e : r.equity) {
      equity.push_back(finiteOrNull(e));
    }
    row["equity"] = std::move(equity);
    row["open_positions"] = r.open_positions;
    rows.push_back(std::move(row));
  }
  j["rows"] = std::move(rows);
  return j;
}

nlohmann::json variantSummaryToJson(const VariantSummary& s) {
  nlohmann::json j;
  j["name"] = s.name;
  j["initial_capital"] = s.initial_capital;
  j["final_equity"] = s.final_equity;
  j["total_return"] = s.total_return;
  j["entry_count"] = s.entry_count;
  j["trade_count"] = s.trade_count;
  j["skipped_entries"] = s.skipped_entries;
  return j;
}

nlohmann::json performanceToJson(const PerformanceStats& p) {
  nlohmann::json j;
  j["final_equity"] = p.final_equity;
  j["total_return_pct"] = p.total_return_pct;
  j["max_equity"] = p.max_equity;
  j["min_equity"] = p.min_equity;
  j["max_drawdown_pct"] = p.max_drawdown_pct;
  j["total_trades"] = p.total_trades;
  j["winning_trades"] = p.winning_trades;
  j["losing_trades"] = p.losing_trades;
  j["win_rate_pct"] = p.win_rate_pct;
  j["avg_win"] = p.avg_win;
  j["avg_loss"] = p.avg_loss;
  j["total_pnl"] = p.total_pnl;
  return j;
}

nlohmann::json signalEvaluationToJson(const SignalEvaluation& e) {
  nlohmann::json j;
  j["name"] = e.name;
  j["total_trades"] = e.total_trades;
  j["long_trades"] = e.long_trades;
  j["short_trades"] = e.short_trades;
  j["win_rate"] = e.win_rate;
  j["long_win_rate"] = e.long_win_rate;
  j["short_win_rate"] = e.short_win_rate;
  return j;
}

std::size_t winnerIndex(const AggregateResult& result) {
  std::size_t best = 0;
  for (std::size_t i = 1; i < result.summaries.size(); ++i) {
    const auto& s = result.summaries[i];
    const auto& b = result.summaries[best];
    if (s.final_equity - s.initial_capital >
        b.final_equity - b.initial_capital) {
      best = i;
    }
  }
  return best;
}

nlohmann::json buildReport(const BacktestConfig& config,
                           const AggregateResult& result,
                           const std::vector<SignalEvaluation>& evaluations) {
  nlohmann::json j;
  j["config"] = backtestConfigToJson(config);

  auto variants = nlohmann::json::array();
  for (std::size_t i = 0; i < result.summaries.size(); ++i) {
    const auto& summary = result.summaries[i];
    const auto& run = result.runs[i];

    nlohmann::json v;
    v["summary"] = variantSummaryToJson(summary);
    v["performance"] = performanceToJson(computePerformance(
        run.equity_curve, run.trades, run.initial_capital, run.final_equity));

    v["evaluation"] = nullptr;
    for (const auto& e : evaluations) {
      if (e.name == summary.name) {
        v["evaluation"] = signalEvaluationToJson(e);
        break;
      }
    }

    auto trades = nlohmann::json::array();
    for (const auto& t : run.trades) {
      trades.push_back(tradeRecordToJson(t));
    }
    v["trades"] = std::move(trades);
    variants.push_back(std::move(v));
  }
  j["variants"] = std::move(variants);
  j["equity"] = equityTableToJson(result.table);

  if (result.summaries.empty()) {
    j["winner"] = nullptr;
  } else {
    j["winner"] = result.summaries[winnerIndex(result)].name;
  }
  return j;
}

void writeReport(const std::string& path, const BacktestConfig& config,
                 const AggregateResult& result,
                 const std::vector<SignalEvaluation>& evaluations) {
  std::ofstream out(path);
  if (!out.is_open()) {
    throw BacktestError("cannot open report file for writing: " + path);
  }
  out << buildReport(config, result, evaluations).dump(2) << "\n";
  if (!out) {
    throw BacktestError("failed writing report file: " + path);
  }
}

}  // namespace pairs
