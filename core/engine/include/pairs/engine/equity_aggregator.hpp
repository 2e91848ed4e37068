#pragma once

#include "pairs/config/backtest_config.hpp"
#include "pairs/engine/simulation_engine.hpp"
#include "pairs/eventbus/event_bus.hpp"
#include "pairs/signal/signal_stream.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace pairs {

// Per-variant headline numbers.
struct VariantSummary {
  std::string name;
  double initial_capital{0.0};
  double final_equity{0.0};
  double total_return{0.0};  // fraction, (final - initial) / initial
  std::size_t entry_count{0};
  std::size_t trade_count{0};
  std::size_t skipped_entries{0};
};

// -----------------------------------------------------------------------------
// EquityTable — variant equity curves side by side, keyed by date
// -----------------------------------------------------------------------------
// rows[i].equity[v] / rows[i].open_positions[v] belong to variant_names[v].
// A variant without a point on a date (cannot happen for runs over the same
// stream, but the table does not assume it) gets NaN equity and 0 positions.
// -----------------------------------------------------------------------------
struct EquityTable {
  struct Row {
    Date date{0};
    std::vector<double> equity;
    std::vector<std::size_t> open_positions;
  };

  std::vector<std::string> variant_names;
  std::vector<Row> rows;
};

struct AggregateResult {
  EquityTable table;
  std::vector<VariantSummary> summaries;
  std::vector<SimulationResult> runs;  // same order as the variants
};

// -----------------------------------------------------------------------------
// EquityAggregator — one SimulationEngine per strategy variant
// -----------------------------------------------------------------------------
//
// @brief  Runs every variant over the same stream and configuration and
//         assembles a comparable multi-series result.
//
// @details
// Each variant gets its own SimulationEngine (and so its own ledger and
// EventBus). Nothing mutable is shared; the stream is read-only. With
// `parallel` set, variants run concurrently via std::async and the results
// are collected in variant order, so the output is identical to a
// sequential run.
//
// A BusHook, if set, is called with the variant and its engine's EventBus
// before that engine runs. It is how callers attach loggers or collectors.
// Under `parallel` hooks' subscribers run on worker threads.
//
// Exceptions thrown by any run (validation failures) propagate out of
// run(); with `parallel` the first failing variant in variant order wins.
// -----------------------------------------------------------------------------
class EquityAggregator {
 public:
  using BusHook = std::function<void(const StrategyVariant&, EventBus&)>;

  // Throws ConfigError if `variants` is empty, names repeat, or config is
  // invalid.
  EquityAggregator(const BacktestConfig& config,
                   std::vector<StrategyVariant> variants,
                   bool parallel = false);

  void setBusHook(BusHook hook) { bus_hook_ = std::move(hook); }

  AggregateResult run(const SignalStream& stream) const;

  const std::vector<StrategyVariant>& variants() const { return variants_; }

 private:
  SimulationResult runVariant(const StrategyVariant& variant,
                              const SignalStream& stream) const;

  static EquityTable buildTable(const std::vector<SimulationResult>& runs);

  BacktestConfig config_;
  std::vector<StrategyVariant> variants_;
  bool parallel_;
  BusHook bus_hook_;
};

}  // namespace pairs
