#include "pairs/time/trading_calendar.hpp"

namespace pairs {

Date add_trading_days(Date start, int n) {
  Date current = start;
  int counted = 0;
  while (counted < n) {
    ++current;
    if (!is_weekend(current)) {
      ++counted;
    }
  }
  return current;
}

}  // namespace pairs
