#pragma once

#include "pairs/time/time_utils.hpp"

namespace pairs {

// -----------------------------------------------------------------------------
// Trading calendar — weekday-only date stepping
// -----------------------------------------------------------------------------
//
// @brief  Pure utilities for the Fixed Horizon exit policy.
//
// @details
// A trading day is any Monday..Friday. Exchange holidays are not modeled:
// the signal stream itself determines which dates are processed, and a
// scheduled close that falls on a date absent from the stream fires on the
// next date that is present.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// add_trading_days(start, n)
// -------------------------------------------------------------------------
// @brief  Returns the date reached by stepping forward n trading days from
//         start, skipping Saturdays and Sundays.
//
// @param  start  Any date (a weekend start is allowed; stepping begins on
//                the following day).
// @param  n      Number of trading days to advance. n <= 0 returns start.
//
// @details
// Steps one calendar day at a time and counts only weekdays, so
//   Friday + 1 → Monday
//   Friday + 5 → next Friday
// -------------------------------------------------------------------------
Date add_trading_days(Date start, int n);

// Calendar days from `from` to `to` (negative if to < from).
inline int calendar_days_between(Date from, Date to) {
  return static_cast<int>(to - from);
}

}  // namespace pairs
