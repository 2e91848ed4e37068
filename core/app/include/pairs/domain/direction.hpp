#pragma once

namespace pairs {
namespace domain {

// -----------------------------------------------------------------------------
// Direction
// -----------------------------------------------------------------------------
// Responsibility: Side of a spread position.
// Long  → bought the spread, profits when it rises (z-score below -entry).
// Short → sold the spread, profits when it falls (z-score above +entry).
// -----------------------------------------------------------------------------
enum class Direction {
  Long,
  Short,
};

// +1 for Long, -1 for Short. Multiplies price moves into signed PnL.
inline double directionSign(Direction d) {
  return d == Direction::Long ? 1.0 : -1.0;
}

inline const char* directionToString(Direction d) {
  switch (d) {
    case Direction::Long:  return "LONG";
    case Direction::Short: return "SHORT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace pairs
