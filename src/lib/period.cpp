#include <isoperiod/period.hpp>

#include <isoperiod/fixed_point.hpp>
#include <isoperiod/parse.hpp>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <stdexcept>

namespace isoperiod {

  namespace {

    void
    append_field(std::string& out, int64_t value, char mark) {
      if (value == 0) { return; }
      out += std::to_string(value);
      out += mark;
    }

    // Seconds as "s[.fff]", with trailing fractional zeros trimmed.
    void
    append_seconds(std::string& out, int64_t millis) {
      if (millis < 0) { out += '-'; }
      // Magnitude via unsigned to cover the most negative value.
      uint64_t magnitude = static_cast<uint64_t>(millis);
      if (millis < 0) { magnitude = uint64_t{0} - magnitude; }
      out += std::to_string(magnitude / fixed_point_scale);
      auto frac = magnitude % fixed_point_scale;
      if (frac != 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, 3 - digits.size(), '0');
        while (digits.back() == '0') {
          digits.pop_back();
        }
        out += '.';
        out += digits;
      }
      out += 'S';
    }

    int64_t
    apply_sign(bool negative, int64_t value) {
      return negative ? -value : value;
    }

  } // namespace

  period::period(std::string_view str) : period(must_parse(str)) {}

  period::period(int64_t years, int64_t months, int64_t days, int64_t hours,
                 int64_t minutes, int64_t milliseconds, bool negative)
      : negative_(negative), years_(years), months_(months), days_(days),
        hours_(hours), minutes_(minutes), milliseconds_(milliseconds) {
    constexpr int64_t lowest = std::numeric_limits<int64_t>::min();
    for (int64_t v : {years, months, days, hours, minutes, milliseconds}) {
      if (v == lowest) {
        throw std::out_of_range("period: component cannot be negated");
      }
    }
    if (is_zero()) { negative_ = false; }
  }

  std::string
  period::to_string() const {
    std::string result;
    if (negative_) { result += '-'; }
    result += 'P';

    if (is_zero()) {
      result += "0D";
      return result;
    }

    append_field(result, years_, 'Y');
    append_field(result, months_, 'M');
    append_field(result, days_, 'D');

    if (hours_ != 0 || minutes_ != 0 || milliseconds_ != 0) {
      result += 'T';
      append_field(result, hours_, 'H');
      append_field(result, minutes_, 'M');
      if (milliseconds_ != 0) { append_seconds(result, milliseconds_); }
    }

    return result;
  }

  bool
  period::is_zero() const {
    return years_ == 0 && months_ == 0 && days_ == 0 && hours_ == 0 &&
           minutes_ == 0 && milliseconds_ == 0;
  }

  bool
  period::is_negative() const {
    return negative_;
  }

  int64_t
  period::years() const {
    return years_;
  }

  int64_t
  period::months() const {
    return months_;
  }

  int64_t
  period::days() const {
    return days_;
  }

  int64_t
  period::hours() const {
    return hours_;
  }

  int64_t
  period::minutes() const {
    return minutes_;
  }

  int64_t
  period::seconds() const {
    return milliseconds_ / fixed_point_scale;
  }

  int64_t
  period::milliseconds() const {
    return milliseconds_;
  }

  int64_t
  period::signed_years() const {
    return apply_sign(negative_, years_);
  }

  int64_t
  period::signed_months() const {
    return apply_sign(negative_, months_);
  }

  int64_t
  period::signed_days() const {
    return apply_sign(negative_, days_);
  }

  int64_t
  period::signed_hours() const {
    return apply_sign(negative_, hours_);
  }

  int64_t
  period::signed_minutes() const {
    return apply_sign(negative_, minutes_);
  }

  int64_t
  period::signed_milliseconds() const {
    return apply_sign(negative_, milliseconds_);
  }

  period
  period::normalise() const {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    if (years_ > max / 12 || years_ < min / 12) {
      throw std::overflow_error("period: years out of range for normalisation");
    }
    int64_t year_months = years_ * 12;
    if ((months_ > 0 && year_months > max - months_) ||
        (months_ < 0 && year_months < min - months_)) {
      throw std::overflow_error("period: months out of range for normalisation");
    }

    int64_t total_months = year_months + months_;
    return period(total_months / 12, total_months % 12, days_, hours_,
                  minutes_, milliseconds_, negative_);
  }

  period
  period::year_month_part() const {
    return period(years_, months_, 0, 0, 0, 0, negative_);
  }

  period
  period::day_time_part() const {
    return period(0, 0, days_, hours_, minutes_, milliseconds_, negative_);
  }

  period
  period::abs() const {
    period result = *this;
    result.negative_ = false;
    return result;
  }

  period
  period::operator-() const {
    period result = *this;
    if (!is_zero()) { result.negative_ = !negative_; }
    return result;
  }

  bool
  period::operator==(const period& other) const {
    return signed_years() == other.signed_years() &&
           signed_months() == other.signed_months() &&
           signed_days() == other.signed_days() &&
           signed_hours() == other.signed_hours() &&
           signed_minutes() == other.signed_minutes() &&
           signed_milliseconds() == other.signed_milliseconds();
  }

} // namespace isoperiod
