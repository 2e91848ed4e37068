#pragma once

#include "pairs/signal/signal_stream.hpp"

#include <istream>
#include <string>

namespace pairs {

// -----------------------------------------------------------------------------
// Signal CSV loader
// -----------------------------------------------------------------------------
//
// @brief  Reads the prediction file written by the feature/prediction layer
//         into a SignalStream.
//
// @details
// Header-driven; column order does not matter.
//
//   Date              required; a column named "Date" or an unnamed first
//                     column (pandas index). "YYYY-MM-DD[ HH:MM:SS]".
//   Pair_ID           required.
//   Z_Score           required; empty/"nan" → NaN (non-actionable).
//   Spread            optional; empty/"nan" → NaN.
//   Target_Return     required; empty/"nan" → NaN.
//   Target_Direction  required; integer 0/1 (also accepts "0.0"/"1.0").
//   <Model>_Pred      one or more; each defines a model named <Model>.
//
// Any other column is ignored.
//
// Throws: SignalValidationError for missing columns, short rows,
//         unparseable dates or numbers (message names line and field).
// -----------------------------------------------------------------------------
SignalStream loadSignalCsv(std::istream& in);

// Opens `path` and delegates to loadSignalCsv(std::istream&).
SignalStream loadSignalCsvFile(const std::string& path);

}  // namespace pairs
