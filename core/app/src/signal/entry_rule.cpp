#include "pairs/signal/entry_rule.hpp"

#include <cmath>

namespace pairs {

EntryRule::EntryRule(double entry_z_threshold, double model_confidence,
                     std::vector<std::size_t> model_indices)
    : entry_z_(entry_z_threshold),
      confidence_(model_confidence),
      model_indices_(std::move(model_indices)) {}

std::optional<domain::Direction> EntryRule::evaluate(
    const domain::SignalRow& row) const {
  if (std::isnan(row.z_score) || model_indices_.empty()) {
    return std::nullopt;
  }

  if (row.z_score < -entry_z_ && allAbove(row, confidence_)) {
    return domain::Direction::Long;
  }
  if (row.z_score > entry_z_ && allBelow(row, 1.0 - confidence_)) {
    return domain::Direction::Short;
  }
  return std::nullopt;
}

bool EntryRule::allAbove(const domain::SignalRow& row, double level) const {
  for (std::size_t idx : model_indices_) {
    if (!(row.predictions.at(idx) > level)) {
      return false;
    }
  }
  return true;
}

bool EntryRule::allBelow(const domain::SignalRow& row, double level) const {
  for (std::size_t idx : model_indices_) {
    if (!(row.predictions.at(idx) < level)) {
      return false;
    }
  }
  return true;
}

}  // namespace pairs
