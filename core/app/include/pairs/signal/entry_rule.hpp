#pragma once

#include "pairs/domain/direction.hpp"
#include "pairs/domain/signal_row.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace pairs {

// -----------------------------------------------------------------------------
// EntryRule — z-score trigger filtered by model direction
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a row is an entry and in which direction.
//
// @details
//   Long  ⇔ z < -entry_z  AND every selected model predicts Up
//   Short ⇔ z > +entry_z  AND every selected model predicts Down
//
//   Up   ⇔ prediction >  confidence
//   Down ⇔ prediction <  1 - confidence
//
// With binary predictions (0/1) and confidence in [0.5, 1) this reduces to
// "prediction == 1" / "prediction == 0". Selecting several models gives the
// consensus (hybrid) filter. A NaN z-score never triggers.
// -----------------------------------------------------------------------------
class EntryRule {
 public:
  EntryRule(double entry_z_threshold, double model_confidence,
            std::vector<std::size_t> model_indices);

  std::optional<domain::Direction> evaluate(
      const domain::SignalRow& row) const;

 private:
  bool allAbove(const domain::SignalRow& row, double level) const;
  bool allBelow(const domain::SignalRow& row, double level) const;

  double entry_z_;
  double confidence_;
  std::vector<std::size_t> model_indices_;
};

}  // namespace pairs
