#pragma once

#include "pairs/domain/signal_row.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pairs {

// What a particular engine needs from the rows. Built by SimulationEngine
// from its configuration and strategy variant.
struct ValidationRequirements {
  bool require_targets{false};  // outcome-based engines
  std::vector<std::string> models;
};

// -----------------------------------------------------------------------------
// SignalStream — fully materialized, chronologically ordered signal input
// -----------------------------------------------------------------------------
//
// @brief  Owns the rows of one backtest and the names of the models whose
//         predictions they carry. Read-only once constructed; a single
//         stream may be shared by concurrently running engines.
//
// @details
// The constructor stable-sorts rows by date, so rows that share a date keep
// their input order. That order is the iteration order of the simulation
// and therefore part of its deterministic output.
//
// Rows are grouped into DateSlice ranges [begin, end) over rows().
//
// validate() is the only place that throws SignalValidationError for
// content problems; the constructor accepts anything structurally sound
// (prediction vector length must match the model count).
// -----------------------------------------------------------------------------
class SignalStream {
 public:
  struct DateSlice {
    Date date{0};
    std::size_t begin{0};
    std::size_t end{0};
  };

  SignalStream() = default;
  SignalStream(std::vector<std::string> model_names,
               std::vector<domain::SignalRow> rows);

  const std::vector<std::string>& modelNames() const { return model_names_; }
  const std::vector<domain::SignalRow>& rows() const { return rows_; }
  const std::vector<DateSlice>& slices() const { return slices_; }

  bool empty() const { return rows_.empty(); }
  std::size_t size() const { return rows_.size(); }

  // Index of `model` in modelNames(), or -1.
  int modelIndex(const std::string& model) const;

  // First row for pair_id inside the slice, or nullptr.
  const domain::SignalRow* rowFor(const DateSlice& slice,
                                  const std::string& pair_id) const;

  // -------------------------------------------------------------------------
  // validate(requirements)
  // -------------------------------------------------------------------------
  // @brief  Checks every row against the engine's needs before simulation.
  //
  // @details
  // Always checked:
  //   - non-empty pair_id
  //   - at most one row per (date, pair_id)
  //   - every prediction finite and within [0, 1]
  //   - target_direction in {0, 1}
  //   - every requested model exists in modelNames()
  // Conditionally:
  //   - require_targets → target_return finite
  //
  // z_score and spread_price are never validated: NaN means "no action"
  // for that pair on that date, not bad input.
  //
  // Throws: SignalValidationError naming date, pair and field.
  // -------------------------------------------------------------------------
  void validate(const ValidationRequirements& requirements) const;

 private:
  std::vector<std::string> model_names_;
  std::vector<domain::SignalRow> rows_;
  std::vector<DateSlice> slices_;
};

}  // namespace pairs
