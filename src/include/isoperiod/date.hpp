#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace isoperiod {

  struct iso_week_date {
    int32_t year = 0;
    int32_t week = 0;

    bool
    operator==(const iso_week_date& other) const = default;
  };

  // A date in the proleptic Gregorian calendar with astronomical year
  // numbering (year 0 is 1 BC), stored as a day count from 1970-01-01.
  // The zero value is therefore 1970-01-01.
  class date {
    int32_t day_ = 0;

  public:
    date() = default;
    explicit date(std::string_view str);
    // Month and day outside their usual ranges are carried into the
    // neighbouring month or year, so date(2023, 14, 1) is 2024-02-01.
    date(int32_t year, int32_t month, int32_t day);
    explicit date(std::chrono::sys_days days);

    static date
    from_day_number(int32_t day_number);
    static date
    min();
    static date
    max();

    std::string
    to_string() const;
    bool
    is_zero() const;
    int32_t
    day_number() const;

    int32_t
    year() const;
    uint8_t
    month() const;
    uint8_t
    day() const;
    // 1-based day within the year; 366 only occurs in leap years.
    int32_t
    year_day() const;
    std::chrono::weekday
    weekday() const;
    iso_week_date
    iso_week() const;

    // All three throw std::out_of_range when the result cannot be stored.
    date
    add(int32_t days) const;
    date
    add_date(int32_t years, int32_t months, int32_t days) const;
    int32_t
    sub(const date& other) const;

    std::strong_ordering
    operator<=>(const date& other) const = default;
    bool
    operator==(const date& other) const = default;

    explicit
    operator std::chrono::sys_days() const;

    friend std::ostream&
    operator<<(std::ostream& os, const date& d) {
      return os << d.to_string();
    }
  };

} // namespace isoperiod

template <>
struct std::hash<isoperiod::date> {
  std::size_t
  operator()(const isoperiod::date& d) const noexcept {
    return std::hash<int32_t>{}(d.day_number());
  }
};
