#include "pairs/time/time_utils.hpp"

#include <cstdio>

namespace pairs {

namespace {

// Civil-from-days / days-from-civil conversions over 400-year eras.
// Valid for the full int32 day range; no lookup tables.

std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& year, unsigned& month,
                   unsigned& day) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 +
                          (month <= 2 ? 1 : 0));
}

bool isLeapYear(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(int y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeapYear(y)) {
    return 29;
  }
  return kDays[m - 1];
}

bool isDigits(const std::string& s, std::size_t pos, std::size_t len) {
  for (std::size_t i = pos; i < pos + len; ++i) {
    if (s[i] < '0' || s[i] > '9') {
      return false;
    }
  }
  return true;
}

}  // namespace

Date make_date(int year, unsigned month, unsigned day) {
  return static_cast<Date>(daysFromCivil(year, month, day));
}

std::optional<Date> parse_date(const std::string& text) {
  // Strict layout: YYYY-MM-DD, then nothing or a ' '/'T' separated time.
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  if (!isDigits(text, 0, 4) || !isDigits(text, 5, 2) ||
      !isDigits(text, 8, 2)) {
    return std::nullopt;
  }
  if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
    return std::nullopt;
  }

  const int year = std::stoi(text.substr(0, 4));
  const unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
  const unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));

  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
    return std::nullopt;
  }
  return make_date(year, month, day);
}

std::string format_date(Date date) {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civilFromDays(date, year, month, day);

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
  return buf;
}

int weekday(Date date) {
  // 1970-01-01 was a Thursday (index 3 with Monday = 0).
  const int shifted = (static_cast<int>(date) + 3) % 7;
  return shifted < 0 ? shifted + 7 : shifted;
}

}  // namespace pairs
