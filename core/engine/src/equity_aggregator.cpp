#include "pairs/engine/equity_aggregator.hpp"
#include "pairs/domain/errors.hpp"

#include <future>
#include <limits>
#include <map>
#include <set>

namespace pairs {

EquityAggregator::EquityAggregator(const BacktestConfig& config,
                                   std::vector<StrategyVariant> variants,
                                   bool parallel)
    : config_(config), variants_(std::move(variants)), parallel_(parallel) {
  config_.validate();
  if (variants_.empty()) {
    throw ConfigError("at least one strategy variant is required");
  }
  std::set<std::string> names;
  for (const auto& v : variants_) {
    if (!names.insert(v.name).second) {
      throw ConfigError("duplicate strategy variant name '" + v.name + "'");
    }
  }
}

AggregateResult EquityAggregator::run(const SignalStream& stream) const {
  AggregateResult result;
  result.runs.reserve(variants_.size());

  if (parallel_) {
    std::vector<std::future<SimulationResult>> futures;
    futures.reserve(variants_.size());
    for (const auto& variant : variants_) {
      futures.push_back(std::async(std::launch::async, [this, &variant,
                                                        &stream] {
        return runVariant(variant, stream);
      }));
    }
    // get() in variant order: rethrows the first failure in that order,
    // after which the remaining futures join in their destructors.
    for (auto& f : futures) {
      result.runs.push_back(f.get());
    }
  } else {
    for (const auto& variant : variants_) {
      result.runs.push_back(runVariant(variant, stream));
    }
  }

  for (const auto& run : result.runs) {
    VariantSummary s;
    s.name = run.variant;
    s.initial_capital = run.initial_capital;
    s.final_equity = run.final_equity;
    s.total_return = run.total_return;
    s.entry_count = run.entry_count;
    s.trade_count = run.trade_count;
    s.skipped_entries = run.skipped_entries;
    result.summaries.push_back(s);
  }

  result.table = buildTable(result.runs);
  return result;
}

SimulationResult EquityAggregator::runVariant(const StrategyVariant& variant,
                                              const SignalStream& stream) const {
  SimulationEngine engine(config_, variant);
  if (bus_hook_) {
    bus_hook_(variant, engine.eventBus());
  }
  return engine.run(stream);
}

EquityTable EquityAggregator::buildTable(
    const std::vector<SimulationResult>& runs) {
  EquityTable table;
  const std::size_t n = runs.size();

  std::map<Date, EquityTable::Row> by_date;
  for (std::size_t v = 0; v < n; ++v) {
    table.variant_names.push_back(runs[v].variant);
    for (const auto& point : runs[v].equity_curve) {
      auto [it, inserted] = by_date.try_emplace(point.date);
      EquityTable::Row& row = it->second;
      if (inserted) {
        row.date = point.date;
        row.equity.assign(n, std::numeric_limits<double>::quiet_NaN());
        row.open_positions.assign(n, 0);
      }
      row.equity[v] = point.equity;
      row.open_positions[v] = point.open_positions;
    }
  }

  table.rows.reserve(by_date.size());
  for (auto& [date, row] : by_date) {
    table.rows.push_back(std::move(row));
  }
  return table;
}

}  // namespace pairs
