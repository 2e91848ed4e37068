#include "pairs/engine/simulation_engine.hpp"
#include "pairs/domain/errors.hpp"
#include "pairs/risk/position_ledger.hpp"
#include "pairs/signal/entry_rule.hpp"

#include <cmath>

namespace pairs {

SimulationEngine::SimulationEngine(const BacktestConfig& config,
                                   StrategyVariant variant)
    : config_(config),
      variant_(std::move(variant)),
      exit_policy_(makeExitPolicy(config)) {
  config_.validate();
  if (variant_.models.empty()) {
    throw ConfigError("strategy variant '" + variant_.name +
                      "' lists no models");
  }
}

SimulationResult SimulationEngine::run(const SignalStream& stream) {
  const PnlMode mode = pnlModeOf(exit_policy_);

  ValidationRequirements req;
  req.require_targets = (mode == PnlMode::OutcomeBased);
  req.models = variant_.models;
  stream.validate(req);

  std::vector<std::size_t> model_indices;
  for (const auto& model : variant_.models) {
    model_indices.push_back(static_cast<std::size_t>(stream.modelIndex(model)));
  }
  const EntryRule entry_rule(config_.entry_z_threshold,
                             config_.model_confidence, model_indices);

  PositionLedger ledger(bus_, config_, mode);

  SimulationResult result;
  result.variant = variant_.name;
  result.initial_capital = config_.initial_capital;
  result.equity_curve.reserve(stream.slices().size());

  for (const auto& slice : stream.slices()) {
    // --- 1. Expire ----------------------------------------------------------
    for (const auto& pair_id : ledger.openPairIds()) {
      const domain::Position* pos = ledger.position(pair_id);
      const domain::SignalRow* row = stream.rowFor(slice, pair_id);
      const auto reason = exitReason(exit_policy_, *pos, slice.date, row);
      if (reason) {
        ledger.close(pair_id, slice.date, *reason,
                     row ? std::optional<double>(row->spread_price)
                         : std::nullopt);
      }
    }

    // --- 2. Signal ----------------------------------------------------------
    PositionLedger::PriceMap prices;
    for (std::size_t i = slice.begin; i < slice.end; ++i) {
      const domain::SignalRow& row = stream.rows()[i];
      prices[row.pair_id] = row.spread_price;

      if (ledger.isOpen(row.pair_id)) {
        continue;
      }
      // No usable spread means no price to size or fill at.
      if (mode == PnlMode::PriceBased &&
          (!std::isfinite(row.spread_price) || row.spread_price == 0.0)) {
        continue;
      }
      const auto direction = entry_rule.evaluate(row);
      if (!direction) {
        continue;
      }
      ledger.open(row, *direction,
                  scheduledCloseDate(exit_policy_, row.date));
    }

    // --- 3. Record ----------------------------------------------------------
    domain::EquityPoint point;
    point.date = slice.date;
    point.equity = ledger.markToMarket(prices);
    point.open_positions = ledger.openCount();
    result.equity_curve.push_back(point);
    bus_.publish(DailySnapshotEvent{point});
  }

  // --- 4. Drain --------------------------------------------------------------
  if (!stream.slices().empty()) {
    const auto& last = stream.slices().back();
    for (const auto& pair_id : ledger.openPairIds()) {
      const domain::SignalRow* row = stream.rowFor(last, pair_id);
      ledger.close(pair_id, last.date, domain::CloseReason::EndOfBacktest,
                   row ? std::optional<double>(row->spread_price)
                       : std::nullopt);
    }
  }

  result.final_equity = ledger.equity();
  result.total_return =
      (result.final_equity - result.initial_capital) / result.initial_capital;
  result.entry_count = ledger.entryCount();
  result.trade_count = ledger.exitCount();
  result.skipped_entries = ledger.skippedEntries();
  result.trades = ledger.trades();
  return result;
}

}  // namespace pairs
