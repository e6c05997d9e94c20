#pragma once

#include <cstdint>
#include <stdexcept>

namespace isoperiod::detail {

  struct civil_date {
    int64_t year;
    uint8_t month;
    uint8_t day;
  };

  inline bool
  is_leap_year(int64_t year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
  }

  inline uint8_t
  days_in_month(int64_t year, uint8_t month) {
    static constexpr uint8_t table[] = {0,  31, 28, 31, 30, 31, 30,
                                        31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
      throw std::invalid_argument("days_in_month: invalid month");
    }
    if (month == 2 && is_leap_year(year)) { return 29; }
    return table[month];
  }

  inline int64_t
  floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) { --q; }
    return q;
  }

  // Days since 1970-01-01 for a proleptic Gregorian date. Works in 400-year
  // eras so that years far outside std::chrono::year's range are handled.
  inline int64_t
  days_from_civil(int64_t year, uint8_t month, uint8_t day) {
    int64_t y = month <= 2 ? year - 1 : year;
    int64_t era = floor_div(y, 400);
    int64_t yoe = y - era * 400;
    int64_t mp = month > 2 ? month - 3 : month + 9;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
  }

  inline civil_date
  civil_from_days(int64_t days) {
    int64_t z = days + 719468;
    int64_t era = floor_div(z, 146097);
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return {y, static_cast<uint8_t>(m), static_cast<uint8_t>(d)};
  }

} // namespace isoperiod::detail
