#include "pairs/risk/exit_policy.hpp"
#include "pairs/time/trading_calendar.hpp"

#include <cmath>

namespace pairs {

ExitPolicy makeExitPolicy(const BacktestConfig& config) {
  switch (config.exit_policy) {
    case ExitPolicyKind::SignalReversal:
      return SignalReversalExit{config.exit_z_threshold};
    case ExitPolicyKind::FixedHorizon:
      return FixedHorizonExit{config.hold_period};
  }
  return SignalReversalExit{config.exit_z_threshold};
}

PnlMode pnlModeOf(const ExitPolicy& policy) {
  return std::holds_alternative<FixedHorizonExit>(policy)
             ? PnlMode::OutcomeBased
             : PnlMode::PriceBased;
}

std::optional<Date> scheduledCloseDate(const ExitPolicy& policy,
                                       Date open_date) {
  if (const auto* horizon = std::get_if<FixedHorizonExit>(&policy)) {
    return add_trading_days(open_date, horizon->hold_period);
  }
  return std::nullopt;
}

std::optional<domain::CloseReason> exitReason(const ExitPolicy& policy,
                                              const domain::Position& position,
                                              Date date,
                                              const domain::SignalRow* row) {
  if (const auto* reversal = std::get_if<SignalReversalExit>(&policy)) {
    if (row == nullptr || std::isnan(row->z_score) ||
        !std::isfinite(row->spread_price)) {
      return std::nullopt;
    }
    if (std::abs(row->z_score) < reversal->exit_z_threshold) {
      return domain::CloseReason::MeanReversion;
    }
    return std::nullopt;
  }

  if (position.scheduled_close_date && date >= *position.scheduled_close_date) {
    return domain::CloseReason::Horizon;
  }
  return std::nullopt;
}

}  // namespace pairs
