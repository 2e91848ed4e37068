#include "pairs/risk/position_ledger.hpp"
#include "pairs/time/trading_calendar.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace pairs {

// -----------------------------------------------------------------------------
// Constructor: all capital starts available
// -----------------------------------------------------------------------------
PositionLedger::PositionLedger(EventBus& bus, const BacktestConfig& config,
                               PnlMode mode)
    : bus_(bus),
      config_(config),
      costs_(config),
      mode_(mode),
      available_capital_(config.initial_capital),
      realized_equity_(config.initial_capital) {}

// -----------------------------------------------------------------------------
// open: capacity checks, capital deduction, Entry record
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionLedger::open(
    const domain::SignalRow& row, domain::Direction direction,
    std::optional<Date> scheduled_close) {
  if (isOpen(row.pair_id)) {
    std::cerr << "[PositionLedger] WARNING: " << row.pair_id
              << " already open on " << format_date(row.date)
              << ". Ignoring entry.\n";
    return std::nullopt;
  }

  const double capital = nextTradeCapital();

  if (positions_.size() >= config_.max_positions) {
    skip(row, direction, SkipReason::MaxPositions, capital);
    return std::nullopt;
  }

  const double required = capital * config_.capital_buffer;
  if (capital <= 0.0 || available_capital_ < required) {
    skip(row, direction, SkipReason::InsufficientCapital, required);
    return std::nullopt;
  }

  domain::Position pos;
  pos.pair_id = row.pair_id;
  pos.direction = direction;
  pos.open_date = row.date;
  pos.invested_capital = capital;
  pos.scheduled_close_date = scheduled_close;

  if (mode_ == PnlMode::PriceBased) {
    // size = capital / |spread| needs a finite, non-zero spread.
    if (!std::isfinite(row.spread_price) || row.spread_price == 0.0) {
      std::cerr << "[PositionLedger] WARNING: no usable spread for "
                << row.pair_id << " on " << format_date(row.date)
                << ". Ignoring entry.\n";
      return std::nullopt;
    }
    pos.entry_spread = row.spread_price;
    pos.entry_price =
        costs_.adjustedPrice(row.spread_price, direction, PriceLeg::Entry);
    pos.size = capital / std::abs(row.spread_price);
    pos.last_spread = row.spread_price;

    // Marking at the entry spread already shows the round-trip friction.
    const double exit_now =
        costs_.adjustedPrice(row.spread_price, direction, PriceLeg::Exit);
    pos.unrealized_pnl = (exit_now - pos.entry_price) * pos.size *
                         domain::directionSign(direction);

    available_capital_ -= capital;
  } else {
    if (!std::isfinite(row.target_return)) {
      std::cerr << "[PositionLedger] WARNING: no target outcome for "
                << row.pair_id << " on " << format_date(row.date)
                << ". Ignoring entry.\n";
      return std::nullopt;
    }
    const int holding_days =
        scheduled_close ? calendar_days_between(row.date, *scheduled_close)
                        : 0;
    pos.entry_cost = costs_.cost(direction, capital, holding_days).total();
    pos.target_pnl = outcomePnl(row, direction, capital);

    // Fees are sunk at entry.
    available_capital_ -= capital + pos.entry_cost;
    realized_equity_ -= pos.entry_cost;
  }

  positions_.push_back(pos);
  ++entry_count_;

  domain::TradeRecord trade;
  trade.date = row.date;
  trade.pair_id = row.pair_id;
  trade.event_type = domain::TradeEventType::Entry;
  trade.direction = direction;
  trade.price = pos.entry_price;
  trade.invested_capital = capital;
  trade.cost = pos.entry_cost;
  trades_.push_back(trade);

  bus_.publish(PositionOpenedEvent{pos, trade});
  return pos;
}

// -----------------------------------------------------------------------------
// markToMarket: refresh unrealized PnL from today's spreads
// -----------------------------------------------------------------------------
double PositionLedger::markToMarket(const PriceMap& prices) {
  if (mode_ == PnlMode::OutcomeBased) {
    return equity();
  }

  for (auto& pos : positions_) {
    auto it = prices.find(pos.pair_id);
    if (it == prices.end() || !std::isfinite(it->second)) {
      continue;
    }
    pos.last_spread = it->second;
    const double mark =
        costs_.adjustedPrice(pos.last_spread, pos.direction, PriceLeg::Exit);
    pos.unrealized_pnl = (mark - pos.entry_price) * pos.size *
                         domain::directionSign(pos.direction);
  }
  return equity();
}

// -----------------------------------------------------------------------------
// close: realize PnL, release capital, Exit record
// -----------------------------------------------------------------------------
double PositionLedger::close(const std::string& pair_id, Date date,
                             domain::CloseReason reason,
                             std::optional<double> spread_price) {
  auto it = std::find_if(
      positions_.begin(), positions_.end(),
      [&pair_id](const domain::Position& p) { return p.pair_id == pair_id; });
  if (it == positions_.end()) {
    return 0.0;
  }

  const domain::Position pos = *it;
  positions_.erase(it);

  domain::TradeRecord trade;
  trade.date = date;
  trade.pair_id = pair_id;
  trade.event_type = domain::TradeEventType::Exit;
  trade.direction = pos.direction;
  trade.invested_capital = pos.invested_capital;
  trade.close_reason = reason;

  double net = 0.0;
  if (mode_ == PnlMode::PriceBased) {
    const double spread = (spread_price && std::isfinite(*spread_price))
                              ? *spread_price
                              : pos.last_spread;
    const double exit_price =
        costs_.adjustedPrice(spread, pos.direction, PriceLeg::Exit);
    net = (exit_price - pos.entry_price) * pos.size *
          domain::directionSign(pos.direction);

    trade.price = exit_price;
    trade.cost = (std::abs(pos.entry_price - pos.entry_spread) +
                  std::abs(exit_price - spread)) *
                 pos.size;

    available_capital_ += pos.invested_capital + net;
    realized_equity_ += net;
  } else {
    net = pos.target_pnl - pos.entry_cost;
    trade.cost = pos.entry_cost;

    // Entry fees were already taken out of both balances.
    available_capital_ += pos.invested_capital + pos.target_pnl;
    realized_equity_ += pos.target_pnl;
  }

  trade.realized_pnl = net;
  trade.pnl_pct = pos.invested_capital > 0.0
                      ? net / pos.invested_capital * 100.0
                      : 0.0;
  trades_.push_back(trade);
  ++exit_count_;

  bus_.publish(PositionClosedEvent{trade, available_capital_});
  return net;
}

bool PositionLedger::isOpen(const std::string& pair_id) const {
  return position(pair_id) != nullptr;
}

const domain::Position* PositionLedger::position(
    const std::string& pair_id) const {
  for (const auto& p : positions_) {
    if (p.pair_id == pair_id) {
      return &p;
    }
  }
  return nullptr;
}

std::vector<std::string> PositionLedger::openPairIds() const {
  std::vector<std::string> ids;
  ids.reserve(positions_.size());
  for (const auto& p : positions_) {
    ids.push_back(p.pair_id);
  }
  return ids;
}

double PositionLedger::equity() const {
  double unrealized = 0.0;
  for (const auto& p : positions_) {
    unrealized += p.unrealized_pnl;
  }
  return realized_equity_ + unrealized;
}

double PositionLedger::nextTradeCapital() const {
  if (config_.riskPct() > 0.0) {
    return realized_equity_ * config_.riskPct();
  }
  return config_.capital_per_trade;
}

void PositionLedger::skip(const domain::SignalRow& row,
                          domain::Direction direction, SkipReason reason,
                          double required) {
  ++skipped_entries_;

  EntrySkippedEvent e;
  e.date = row.date;
  e.pair_id = row.pair_id;
  e.direction = direction;
  e.reason = reason;
  e.available_capital = available_capital_;
  e.required_capital = required;
  bus_.publish(e);
}

// -----------------------------------------------------------------------------
// outcomePnl: the labeled direction decides win or loss, the return's
// magnitude decides how much.
// -----------------------------------------------------------------------------
double PositionLedger::outcomePnl(const domain::SignalRow& row,
                                  domain::Direction direction,
                                  double capital) {
  const bool won =
      (direction == domain::Direction::Long && row.target_direction == 1) ||
      (direction == domain::Direction::Short && row.target_direction == 0);
  const double magnitude = capital * std::abs(row.target_return);
  return won ? magnitude : -magnitude;
}

}  // namespace pairs
