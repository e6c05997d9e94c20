#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>

namespace isoperiod {

  // A signed ISO-8601 period. Components are whole-unit counts except the
  // seconds field, which is held in milliseconds. The overall sign is kept
  // separately and applies to every component; a component may still carry
  // its own sign when the text spelled one (e.g. "P-1Y13M").
  class period {
    bool negative_ = false;
    int64_t years_ = 0;
    int64_t months_ = 0;
    int64_t days_ = 0;
    int64_t hours_ = 0;
    int64_t minutes_ = 0;
    int64_t milliseconds_ = 0;

  public:
    period() = default;
    explicit period(std::string_view str);
    // Throws std::out_of_range if any component is the most negative
    // int64_t, which has no negation.
    period(int64_t years, int64_t months, int64_t days, int64_t hours = 0,
           int64_t minutes = 0, int64_t milliseconds = 0,
           bool negative = false);

    std::string
    to_string() const;
    bool
    is_zero() const;
    bool
    is_negative() const;

    int64_t
    years() const;
    int64_t
    months() const;
    int64_t
    days() const;
    int64_t
    hours() const;
    int64_t
    minutes() const;
    // Whole seconds, truncated toward zero.
    int64_t
    seconds() const;
    int64_t
    milliseconds() const;

    // Components with the overall sign applied.
    int64_t
    signed_years() const;
    int64_t
    signed_months() const;
    int64_t
    signed_days() const;
    int64_t
    signed_hours() const;
    int64_t
    signed_minutes() const;
    int64_t
    signed_milliseconds() const;

    // Folds whole multiples of 12 months into years. No other unit is
    // carried: days, hours, minutes and seconds are left exactly as they are.
    // Throws std::overflow_error if years * 12 + months is not representable.
    period
    normalise() const;

    period
    year_month_part() const;
    period
    day_time_part() const;

    period
    abs() const;
    period
    operator-() const;

    bool
    operator==(const period& other) const;

    friend std::ostream&
    operator<<(std::ostream& os, const period& p) {
      return os << p.to_string();
    }
  };

} // namespace isoperiod

template <>
struct std::hash<isoperiod::period> {
  std::size_t
  operator()(const isoperiod::period& p) const noexcept {
    std::size_t seed = 0;
    for (int64_t v : {p.signed_years(), p.signed_months(), p.signed_days(),
                      p.signed_hours(), p.signed_minutes(),
                      p.signed_milliseconds()}) {
      seed ^= std::hash<int64_t>{}(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
