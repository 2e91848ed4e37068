#include "pairs/signal/signal_stream.hpp"
#include "pairs/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace pairs {

SignalStream::SignalStream(std::vector<std::string> model_names,
                           std::vector<domain::SignalRow> rows)
    : model_names_(std::move(model_names)), rows_(std::move(rows)) {
  for (const auto& row : rows_) {
    if (row.predictions.size() != model_names_.size()) {
      throw SignalValidationError(
          format_date(row.date), row.pair_id, "predictions",
          "row carries " + std::to_string(row.predictions.size()) +
              " predictions but the stream declares " +
              std::to_string(model_names_.size()) + " models");
    }
  }

  std::stable_sort(rows_.begin(), rows_.end(),
                   [](const domain::SignalRow& a, const domain::SignalRow& b) {
                     return a.date < b.date;
                   });

  std::size_t begin = 0;
  while (begin < rows_.size()) {
    std::size_t end = begin + 1;
    while (end < rows_.size() && rows_[end].date == rows_[begin].date) {
      ++end;
    }
    slices_.push_back(DateSlice{rows_[begin].date, begin, end});
    begin = end;
  }
}

int SignalStream::modelIndex(const std::string& model) const {
  auto it = std::find(model_names_.begin(), model_names_.end(), model);
  if (it == model_names_.end()) {
    return -1;
  }
  return static_cast<int>(it - model_names_.begin());
}

const domain::SignalRow* SignalStream::rowFor(
    const DateSlice& slice, const std::string& pair_id) const {
  for (std::size_t i = slice.begin; i < slice.end; ++i) {
    if (rows_[i].pair_id == pair_id) {
      return &rows_[i];
    }
  }
  return nullptr;
}

void SignalStream::validate(const ValidationRequirements& req) const {
  for (const auto& model : req.models) {
    if (modelIndex(model) < 0) {
      throw SignalValidationError("", "", model + "_Pred",
                                  "unknown model '" + model + "'");
    }
  }

  for (const auto& slice : slices_) {
    std::unordered_set<std::string> seen;
    for (std::size_t i = slice.begin; i < slice.end; ++i) {
      const domain::SignalRow& row = rows_[i];
      const std::string date = format_date(row.date);

      if (row.pair_id.empty()) {
        throw SignalValidationError(date, "", "Pair_ID", "empty pair id");
      }
      if (!seen.insert(row.pair_id).second) {
        throw SignalValidationError(date, row.pair_id, "Pair_ID",
                                    "duplicate row for pair on date");
      }

      for (std::size_t m = 0; m < row.predictions.size(); ++m) {
        const double p = row.predictions[m];
        if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
          throw SignalValidationError(date, row.pair_id,
                                      model_names_[m] + "_Pred",
                                      "prediction must lie in [0, 1]");
        }
      }

      if (row.target_direction != 0 && row.target_direction != 1) {
        throw SignalValidationError(date, row.pair_id, "Target_Direction",
                                    "target direction must be 0 or 1");
      }
      if (req.require_targets && !std::isfinite(row.target_return)) {
        throw SignalValidationError(
            date, row.pair_id, "Target_Return",
            "outcome-based simulation needs a finite target return");
      }
    }
  }
}

}  // namespace pairs
