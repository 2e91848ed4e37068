#include "pairs/cost/cost_model.hpp"

#include <algorithm>
#include <cmath>

namespace pairs {

CostModel::CostModel(const BacktestConfig& config)
    : commission_(config.commission),
      slippage_pct_(config.slippage_pct),
      spread_pct_(config.spread_pct),
      annual_borrow_rate_(config.annual_borrow_rate),
      transaction_cost_pct_(config.transaction_cost_pct) {}

CostBreakdown CostModel::cost(domain::Direction direction, double capital,
                              int holding_days) const {
  CostBreakdown c;
  c.commission = commission_;
  c.slippage = capital * slippage_pct_;
  c.spread = capital * spread_pct_;

  if (direction == domain::Direction::Short) {
    const int days = std::max(holding_days, 0);
    c.borrow = capital * annual_borrow_rate_ * days / 365.0;
  }
  return c;
}

double CostModel::adjustedPrice(double price, domain::Direction direction,
                                PriceLeg leg) const {
  // Paying up happens on Long entries and Short exits (buying the spread);
  // every other leg sells the spread and receives less.
  const bool buying = (direction == domain::Direction::Long) ==
                      (leg == PriceLeg::Entry);
  const double friction = std::abs(price) * transaction_cost_pct_;
  return buying ? price + friction : price - friction;
}

}  // namespace pairs
