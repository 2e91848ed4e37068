#pragma once

#include "pairs/config/backtest_config.hpp"
#include "pairs/domain/position.hpp"
#include "pairs/domain/signal_row.hpp"
#include "pairs/domain/trade_record.hpp"
#include "pairs/time/time_utils.hpp"

#include <optional>
#include <variant>

namespace pairs {

// -----------------------------------------------------------------------------
// Exit policies
// -----------------------------------------------------------------------------
//
// @brief  The rule that turns an open position into a close, as a tagged
//         variant injected into the one SimulationEngine.
//
// @details
// SignalReversalExit (price-based):
//   Closes on the first date the pair's |z_score| < exit_z_threshold. The
//   exit fill uses that date's spread. A missing row or NaN z-score for the
//   pair on a date is "no action".
//
// FixedHorizonExit (outcome-based):
//   Closes once the date reaches scheduled_close_date =
//   add_trading_days(open_date, hold_period). The comparison is >= so a
//   scheduled date absent from the stream closes on the next date present.
//   PnL comes from the outcome captured at entry; no row is needed.
//
// Both: positions still open after the last date are force-closed by the
// engine with CloseReason::EndOfBacktest.
// -----------------------------------------------------------------------------
struct SignalReversalExit {
  double exit_z_threshold{0.5};
};

struct FixedHorizonExit {
  int hold_period{10};
};

using ExitPolicy = std::variant<SignalReversalExit, FixedHorizonExit>;

// How a position's PnL is produced; fixed by the exit policy.
enum class PnlMode {
  PriceBased,
  OutcomeBased,
};

ExitPolicy makeExitPolicy(const BacktestConfig& config);

PnlMode pnlModeOf(const ExitPolicy& policy);

// Close date assigned at entry; std::nullopt for signal-driven exits.
std::optional<Date> scheduledCloseDate(const ExitPolicy& policy,
                                       Date open_date);

// -------------------------------------------------------------------------
// exitReason(policy, position, date, row)
// -------------------------------------------------------------------------
// @param  position  The open position being evaluated.
// @param  date      The date being processed.
// @param  row       The pair's row for `date`, or nullptr if none.
//
// @return The close reason if the position must close on `date`,
//         std::nullopt otherwise.
// -------------------------------------------------------------------------
std::optional<domain::CloseReason> exitReason(const ExitPolicy& policy,
                                              const domain::Position& position,
                                              Date date,
                                              const domain::SignalRow* row);

}  // namespace pairs
