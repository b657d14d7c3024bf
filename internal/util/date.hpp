#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace modelplan::util {

/*
  Calendar date with day precision.

  Stored as a day count since 1970-01-01 in the proleptic Gregorian
  calendar. Planning never reads the wall clock; every date it uses
  arrives through this type.
*/
class Date {
 public:
  Date() = default;

  static Date FromCivil(int year, unsigned month, unsigned day);
  static Date FromDays(std::int64_t days);

  // Strict ISO-8601 "YYYY-MM-DD". Throws InvalidArgument.
  static Date Parse(std::string_view text);

  std::int64_t DaysSinceEpoch() const {
    return days_;
  }

  int      Year() const;
  unsigned Month() const;
  unsigned Day() const;

  std::string ToString() const;

  Date AddDays(std::int64_t days) const {
    return Date(days_ + days);
  }

  Date SubtractDays(std::int64_t days) const {
    return Date(days_ - days);
  }

  friend bool operator==(Date a, Date b) {
    return a.days_ == b.days_;
  }
  friend bool operator!=(Date a, Date b) {
    return a.days_ != b.days_;
  }
  friend bool operator<(Date a, Date b) {
    return a.days_ < b.days_;
  }
  friend bool operator<=(Date a, Date b) {
    return a.days_ <= b.days_;
  }
  friend bool operator>(Date a, Date b) {
    return a.days_ > b.days_;
  }
  friend bool operator>=(Date a, Date b) {
    return a.days_ >= b.days_;
  }

 private:
  explicit Date(std::int64_t days) : days_(days) {
  }

  std::int64_t days_ = 0;
};

} // namespace modelplan::util
