#pragma once

#include "pairs/config/backtest_config.hpp"
#include "pairs/cost/cost_model.hpp"
#include "pairs/domain/position.hpp"
#include "pairs/domain/signal_row.hpp"
#include "pairs/domain/trade_record.hpp"
#include "pairs/eventbus/event_bus.hpp"
#include "pairs/risk/exit_policy.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pairs {

// -----------------------------------------------------------------------------
// PositionLedger — open positions, capital and the trade log of one run
// -----------------------------------------------------------------------------
//
// @brief  Sole owner of the run's open positions and capital. Performs
//         open, mark-to-market and close, appends the trade log and
//         publishes PositionOpenedEvent / PositionClosedEvent /
//         EntrySkippedEvent on the run's EventBus.
//
// @details
// State:
//   available_capital_  capital not locked in open positions.
//   realized_equity_    initial capital + net realized PnL − fees already
//                       paid on still-open positions.
//   positions_          open positions in the order they were opened.
//                       At most one per pair, at most max_positions.
//
// Accounting (C = initial capital):
//
//   Outcome-based (Fixed Horizon):
//     open:  available -= capital + fees ; realized_equity -= fees
//     close: available += capital + gross; realized_equity += gross
//     realized_pnl on the Exit record = gross − fees
//     equity() = realized_equity (no daily marking)
//
//   Price-based (Signal Reversal):
//     open:  available -= capital (fees live inside the fill prices)
//     mark:  unrealized = (exit_fill(spread) − entry_price) * size * sign
//     close: available += capital + pnl  ; realized_equity += pnl
//     equity() = realized_equity + Σ unrealized
//
//   In both modes, at every point:
//     available + Σ invested(open) + Σ entry_cost(open)
//       == C + Σ realized_pnl(Exit records)
//
// Rejections:
//   open() returns std::nullopt without changing capital when
//     - the pair already has an open position (not counted), or
//     - positions_ is full                      (counted as skipped), or
//     - available < capital × capital_buffer    (counted as skipped).
//
// close() of a pair with no open position is a no-op returning 0.
//
// Thread model:
//   Single-threaded; owned by one SimulationEngine::run() invocation.
//
// Ownership:
//   Holds a reference to the EventBus owned by the SimulationEngine. The
//   bus must outlive the ledger.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  using PriceMap = std::unordered_map<std::string, double>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  bus     EventBus of the owning run. Events are published
  //                 synchronously from open()/close().
  // @param  config  Validated configuration (copied by value).
  // @param  mode    PnL representation, from pnlModeOf(exit policy).
  // -------------------------------------------------------------------------
  PositionLedger(EventBus& bus, const BacktestConfig& config, PnlMode mode);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;

  // -------------------------------------------------------------------------
  // open(row, direction, scheduled_close)
  // -------------------------------------------------------------------------
  //
  // @brief  Opens a position on row.pair_id at row.date.
  //
  // @param  row              Signal row that triggered the entry. Supplies
  //                          date, pair, spread (price-based) and target
  //                          outcome (outcome-based).
  // @param  direction        Long or Short.
  // @param  scheduled_close  Close date for horizon exits, else nullopt.
  //                          Also sets the borrow horizon for shorts.
  //
  // @return A copy of the new Position, or std::nullopt if rejected.
  //
  // Side-effects: On success deducts capital (and fees), appends an Entry
  //               record, publishes PositionOpenedEvent. On a counted
  //               rejection increments skippedEntries() and publishes
  //               EntrySkippedEvent.
  // -------------------------------------------------------------------------
  std::optional<domain::Position> open(const domain::SignalRow& row,
                                       domain::Direction direction,
                                       std::optional<Date> scheduled_close);

  // -------------------------------------------------------------------------
  // markToMarket(prices)
  // -------------------------------------------------------------------------
  //
  // @brief  Revalues open positions and returns total equity.
  //
  // @param  prices  pair_id → today's spread. Pairs absent from the map (or
  //                 with a non-finite price) keep their previous mark.
  //
  // @details
  // Price-based: unrealized PnL uses the same cost-adjusted exit price that
  // a close would use today. Outcome-based: nothing to revalue; returns the
  // running equity.
  // -------------------------------------------------------------------------
  double markToMarket(const PriceMap& prices);

  // -------------------------------------------------------------------------
  // close(pair_id, date, reason, spread_price)
  // -------------------------------------------------------------------------
  //
  // @brief  Realizes and removes the pair's position.
  //
  // @param  spread_price  Exit spread for price-based positions. When
  //                       absent or non-finite the last marked spread is
  //                       used. Ignored for outcome-based positions.
  //
  // @return Realized PnL net of costs; 0 if the pair was not open.
  //
  // Side-effects: Credits capital, appends an Exit record, publishes
  //               PositionClosedEvent.
  // -------------------------------------------------------------------------
  double close(const std::string& pair_id, Date date,
               domain::CloseReason reason,
               std::optional<double> spread_price = std::nullopt);

  bool isOpen(const std::string& pair_id) const;

  // Read-only pointer to the open position, or nullptr. Invalidated by the
  // next open() or close().
  const domain::Position* position(const std::string& pair_id) const;

  const std::vector<domain::Position>& openPositions() const {
    return positions_;
  }
  std::vector<std::string> openPairIds() const;
  std::size_t openCount() const { return positions_.size(); }

  double availableCapital() const { return available_capital_; }
  double realizedEquity() const { return realized_equity_; }
  double initialCapital() const { return config_.initial_capital; }
  double equity() const;

  // Capital the next entry would commit under the configured sizing.
  double nextTradeCapital() const;

  const std::vector<domain::TradeRecord>& trades() const { return trades_; }
  std::size_t entryCount() const { return entry_count_; }
  std::size_t exitCount() const { return exit_count_; }
  std::size_t skippedEntries() const { return skipped_entries_; }

 private:
  void skip(const domain::SignalRow& row, domain::Direction direction,
            SkipReason reason, double required);

  // Gross PnL implied by the labeled forward outcome.
  static double outcomePnl(const domain::SignalRow& row,
                           domain::Direction direction, double capital);

  EventBus& bus_;
  const BacktestConfig config_;
  const CostModel costs_;
  const PnlMode mode_;

  double available_capital_;
  double realized_equity_;

  std::vector<domain::Position> positions_;
  std::vector<domain::TradeRecord> trades_;

  std::size_t entry_count_{0};
  std::size_t exit_count_{0};
  std::size_t skipped_entries_{0};
};

}  // namespace pairs
