#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pairs {

// -----------------------------------------------------------------------------
// Date
// -----------------------------------------------------------------------------
// Calendar date as a count of days since 1970-01-01 (timezone-naive).
// Signal rows are daily, so "N days later" is integer addition.
// -----------------------------------------------------------------------------
using Date = std::int32_t;

// -------------------------------------------------------------------------
// make_date
// -------------------------------------------------------------------------
// @brief  Converts a proleptic Gregorian (year, month, day) to a Date.
//
// @param  year   Full year, e.g. 2024.
// @param  month  1..12.
// @param  day    1..31. Not range-checked against the month; use
//                parse_date() for untrusted input.
// -------------------------------------------------------------------------
Date make_date(int year, unsigned month, unsigned day);

// -------------------------------------------------------------------------
// parse_date
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD", optionally followed by a time part
//         ("YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS") which is ignored.
//
// @return The Date, or std::nullopt if the text is not a valid calendar
//         date (including day-of-month overflow such as 2023-02-29).
// -------------------------------------------------------------------------
std::optional<Date> parse_date(const std::string& text);

// Formats as "YYYY-MM-DD".
std::string format_date(Date date);

// Day of week using Monday = 0 ... Sunday = 6.
int weekday(Date date);

// True for Saturday (5) and Sunday (6).
inline bool is_weekend(Date date) { return weekday(date) >= 5; }

}  // namespace pairs
