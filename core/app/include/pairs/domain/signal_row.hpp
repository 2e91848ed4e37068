#pragma once

#include "pairs/time/time_utils.hpp"

#include <limits>
#include <string>
#include <vector>

namespace pairs {
namespace domain {

// -----------------------------------------------------------------------------
// SignalRow — one date × pair observation from the feature/prediction layer
// -----------------------------------------------------------------------------
//
// @brief  Immutable input record consumed by the simulation. Produced by the
//         CSV loader (or a test fixture); never mutated by the engine.
//
// @details
// predictions[i] belongs to SignalStream::modelNames()[i]. Values lie in
// [0, 1]: binary classifiers emit exactly 0 or 1, probabilistic models a
// confidence that the spread moves up.
//
// NaN conventions:
//   z_score       NaN → row is non-actionable (no entry, no exit).
//   spread_price  NaN → no price for this pair today; only legal when the
//                       engine is outcome-based.
//   target_return NaN → only legal when the engine is price-based.
// -----------------------------------------------------------------------------
struct SignalRow {
  Date date{0};
  std::string pair_id;
  double z_score{std::numeric_limits<double>::quiet_NaN()};
  double spread_price{std::numeric_limits<double>::quiet_NaN()};
  std::vector<double> predictions;
  double target_return{std::numeric_limits<double>::quiet_NaN()};
  int target_direction{0};  // 1 = spread rose over the label horizon, else 0
};

}  // namespace domain
}  // namespace pairs
