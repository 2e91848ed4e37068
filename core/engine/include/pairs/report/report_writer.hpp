#pragma once

#include "pairs/analysis/performance_stats.hpp"
#include "pairs/analysis/signal_evaluator.hpp"
#include "pairs/config/backtest_config.hpp"
#include "pairs/domain/trade_record.hpp"
#include "pairs/engine/equity_aggregator.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pairs {

// -----------------------------------------------------------------------------
// Report serialization
// -----------------------------------------------------------------------------
//
// Flat JSON objects, one per domain record. Dates are formatted YYYY-MM-DD,
// enums use their *ToString() names, optional fields are null when unset.
// Non-finite doubles (e.g. a NaN cell in the equity table) serialize as null.
// -----------------------------------------------------------------------------

nlohmann::json tradeRecordToJson(const domain::TradeRecord& t);

// { "variants": [...], "rows": [{ "date", "equity": [...],
//                                  "open_positions": [...] }, ...] }
nlohmann::json equityTableToJson(const EquityTable& table);

nlohmann::json variantSummaryToJson(const VariantSummary& s);

nlohmann::json performanceToJson(const PerformanceStats& p);

nlohmann::json signalEvaluationToJson(const SignalEvaluation& e);

// -------------------------------------------------------------------------
// buildReport()
// -------------------------------------------------------------------------
// @brief  Full run report:
//   {
//     "config":      backtestConfigToJson(config),
//     "variants":    [ { "summary", "performance", "evaluation",
//                        "trades": [...] }, ... ],
//     "equity":      equityTableToJson(result.table),
//     "winner":      name of the variant with the highest total net PnL
//   }
//
// `evaluations` is matched to variants by name; a variant without one gets
// a null "evaluation".
// -------------------------------------------------------------------------
nlohmann::json buildReport(const BacktestConfig& config,
                           const AggregateResult& result,
                           const std::vector<SignalEvaluation>& evaluations);

// Writes buildReport() to `path`, pretty-printed. Throws BacktestError if
// the file cannot be opened.
void writeReport(const std::string& path, const BacktestConfig& config,
                 const AggregateResult& result,
                 const std::vector<SignalEvaluation>& evaluations);

// Index into result.summaries of the variant with the highest
// final_equity - initial_capital; ties go to the earlier variant.
std::size_t winnerIndex(const AggregateResult& result);

}  // namespace pairs
