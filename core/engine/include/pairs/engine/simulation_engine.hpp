#pragma once

#include "pairs/config/backtest_config.hpp"
#include "pairs/domain/equity_point.hpp"
#include "pairs/domain/trade_record.hpp"
#include "pairs/eventbus/event_bus.hpp"
#include "pairs/risk/exit_policy.hpp"
#include "pairs/signal/signal_stream.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pairs {

// -----------------------------------------------------------------------------
// SimulationResult
// -----------------------------------------------------------------------------
// Output of one SimulationEngine::run().
//
// equity_curve has one point per processed date, recorded before the
// end-of-backtest drain. final_equity is read after the drain, so for
// outcome-based runs it includes the PnL of force-closed positions.
// -----------------------------------------------------------------------------
struct SimulationResult {
  std::string variant;
  double initial_capital{0.0};
  double final_equity{0.0};
  double total_return{0.0};  // (final - initial) / initial
  std::size_t entry_count{0};
  std::size_t trade_count{0};  // completed round trips (Exit records)
  std::size_t skipped_entries{0};
  std::vector<domain::EquityPoint> equity_curve;
  std::vector<domain::TradeRecord> trades;
};

// -----------------------------------------------------------------------------
// SimulationEngine — the per-date position-lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Replays a SignalStream for one strategy variant and produces the
//         trade log and equity curve.
//
// @details
// For each date, in increasing order:
//
//   1. Expire:  snapshot the open pair ids, ask the ExitPolicy about each,
//               then close the ones that must close. Decisions are taken on
//               the snapshot so closing never disturbs the scan.
//   2. Signal:  for each row of the date in input order, skip pairs that
//               are open, evaluate the EntryRule and try to open.
//   3. Record:  mark to market, append (date, equity, open count) to the
//               curve and publish DailySnapshotEvent.
//
// After the last date every still-open position is closed with
// CloseReason::EndOfBacktest at the last date (price-based: that date's
// spread for the pair, else its last marked spread).
//
// Exits are settled before entries on the same date, so capital released by
// a close is available to that date's entries.
//
// Determinism:
//   No randomness, no wall-clock, no unordered iteration on any path that
//   affects output. Two runs on the same stream produce identical results.
//
// Thread model:
//   run() is single-threaded. Each call builds a fresh PositionLedger, so
//   an engine may be run repeatedly; engines for different variants share
//   nothing mutable and may run on different threads. Subscribers on
//   eventBus() are invoked on the thread calling run().
//
// Ownership:
//   Owns its EventBus and copies of the configuration and variant.
// -----------------------------------------------------------------------------
class SimulationEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config   Run configuration. validate() is called here.
  // @param  variant  Models whose consensus gates entries. Must list at
  //                  least one model.
  //
  // Throws: ConfigError on an invalid configuration or empty variant.
  // -------------------------------------------------------------------------
  SimulationEngine(const BacktestConfig& config, StrategyVariant variant);

  SimulationEngine(const SimulationEngine&) = delete;
  SimulationEngine& operator=(const SimulationEngine&) = delete;

  // -------------------------------------------------------------------------
  // run(stream)
  // -------------------------------------------------------------------------
  // @brief  Validates the stream for this engine, then simulates it.
  //
  // @return The run's SimulationResult. An empty stream yields an empty
  //         curve, no trades and final_equity == initial_capital.
  //
  // Throws: SignalValidationError if the stream lacks what this engine
  //         needs. Nothing is simulated in that case.
  // -------------------------------------------------------------------------
  SimulationResult run(const SignalStream& stream);

  EventBus& eventBus() { return bus_; }

  const BacktestConfig& config() const { return config_; }
  const StrategyVariant& variant() const { return variant_; }
  const ExitPolicy& exitPolicy() const { return exit_policy_; }

 private:
  const BacktestConfig config_;
  const StrategyVariant variant_;
  const ExitPolicy exit_policy_;
  EventBus bus_;
};

}  // namespace pairs
