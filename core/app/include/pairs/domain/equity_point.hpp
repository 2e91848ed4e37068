#pragma once

#include "pairs/time/time_utils.hpp"

#include <cstddef>

namespace pairs {
namespace domain {

// One equity curve sample, recorded after a date's exits, entries and
// mark-to-market have been applied.
struct EquityPoint {
  Date date{0};
  double equity{0.0};
  std::size_t open_positions{0};
};

}  // namespace domain
}  // namespace pairs
