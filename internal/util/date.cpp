#include "date.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"

namespace modelplan::util {

namespace {

struct Civil {
  int      year;
  unsigned month;
  unsigned day;
};

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t DaysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned     yoe = static_cast<unsigned>(y - era * 400);
  const unsigned     doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned     doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Civil CivilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned     doe = static_cast<unsigned>(z - era * 146097);
  const unsigned     yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y   = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned     doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned     mp  = (5 * doy + 2) / 153;
  const unsigned     d   = doy - (153 * mp + 2) / 5 + 1;
  const unsigned     m   = mp < 10 ? mp + 3 : mp - 9;
  return {static_cast<int>(y + (m <= 2)), m, d};
}

bool IsLeap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(int y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && IsLeap(y)) {
    return 29;
  }
  return kDays[m - 1];
}

bool ParseDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  out = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    out = out * 10 + (c - '0');
  }
  return true;
}

} // namespace

Date Date::FromCivil(int year, unsigned month, unsigned day) {
  if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
    throw InvalidArgument("invalid calendar date: " + std::to_string(year) + "-" + std::to_string(month) + "-" +
                          std::to_string(day));
  }
  return Date(DaysFromCivil(year, month, day));
}

Date Date::FromDays(std::int64_t days) {
  return Date(days);
}

Date Date::Parse(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw InvalidArgument("invalid date '" + std::string(text) + "': expected YYYY-MM-DD");
  }

  int year = 0, month = 0, day = 0;
  if (!ParseDigits(text, 0, 4, year) || !ParseDigits(text, 5, 2, month) || !ParseDigits(text, 8, 2, day)) {
    throw InvalidArgument("invalid date '" + std::string(text) + "': expected YYYY-MM-DD");
  }

  return FromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

int Date::Year() const {
  return CivilFromDays(days_).year;
}

unsigned Date::Month() const {
  return CivilFromDays(days_).month;
}

unsigned Date::Day() const {
  return CivilFromDays(days_).day;
}

std::string Date::ToString() const {
  const auto civil = CivilFromDays(days_);
  char       buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", civil.year, civil.month, civil.day);
  return buf;
}

} // namespace modelplan::util
