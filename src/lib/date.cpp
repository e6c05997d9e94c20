#include <isoperiod/date.hpp>

#include "calendar.hpp"

#include <limits>
#include <stdexcept>

namespace isoperiod {

  namespace {

    int32_t
    checked_day_number(int64_t days) {
      if (days < std::numeric_limits<int32_t>::min() ||
          days > std::numeric_limits<int32_t>::max()) {
        throw std::out_of_range("date: out of range");
      }
      return static_cast<int32_t>(days);
    }

    // Month and day outside their usual ranges roll over into the
    // neighbouring month or year.
    int64_t
    normalised_day_number(int64_t year, int64_t month, int64_t day) {
      int64_t m0 = month - 1;
      int64_t carry = detail::floor_div(m0, 12);
      year += carry;
      m0 -= carry * 12;
      return detail::days_from_civil(year, static_cast<uint8_t>(m0 + 1), 1) +
             (day - 1);
    }

    int64_t
    parse_digits(std::string_view str, std::size_t& pos,
                 std::size_t min_digits) {
      int64_t value = 0;
      std::size_t start = pos;
      while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
        if (pos - start >= 10) {
          throw std::invalid_argument("date: too many digits");
        }
        value = value * 10 + (str[pos] - '0');
        ++pos;
      }
      if (pos - start < min_digits) {
        throw std::invalid_argument("date: insufficient digits");
      }
      return value;
    }

    int64_t
    parse_date_str(std::string_view str) {
      if (str.empty()) { throw std::invalid_argument("date: empty string"); }

      std::size_t pos = 0;

      bool neg_year = false;
      if (str[pos] == '-') {
        neg_year = true;
        ++pos;
      }

      int64_t year = parse_digits(str, pos, 4);
      if (neg_year) { year = -year; }

      if (pos >= str.size() || str[pos] != '-') {
        throw std::invalid_argument("date: expected '-' after year");
      }
      ++pos;

      std::size_t month_start = pos;
      int64_t month = parse_digits(str, pos, 2);
      if (pos - month_start != 2) {
        throw std::invalid_argument("date: month must be 2 digits");
      }
      if (month < 1 || month > 12) {
        throw std::invalid_argument("date: month out of range");
      }

      if (pos >= str.size() || str[pos] != '-') {
        throw std::invalid_argument("date: expected '-' after month");
      }
      ++pos;

      std::size_t day_start = pos;
      int64_t day = parse_digits(str, pos, 2);
      if (pos - day_start != 2) {
        throw std::invalid_argument("date: day must be 2 digits");
      }
      if (day < 1 ||
          day > detail::days_in_month(year, static_cast<uint8_t>(month))) {
        throw std::invalid_argument("date: day out of range");
      }

      if (pos != str.size()) {
        throw std::invalid_argument("date: trailing characters");
      }

      return detail::days_from_civil(year, static_cast<uint8_t>(month),
                                     static_cast<uint8_t>(day));
    }

  } // namespace

  date::date(std::string_view str)
      : day_(checked_day_number(parse_date_str(str))) {}

  date::date(int32_t year, int32_t month, int32_t day)
      : day_(checked_day_number(normalised_day_number(year, month, day))) {}

  date::date(std::chrono::sys_days days)
      : day_(checked_day_number(days.time_since_epoch().count())) {}

  date
  date::from_day_number(int32_t day_number) {
    date result;
    result.day_ = day_number;
    return result;
  }

  date
  date::min() {
    return from_day_number(std::numeric_limits<int32_t>::min());
  }

  date
  date::max() {
    return from_day_number(std::numeric_limits<int32_t>::max());
  }

  std::string
  date::to_string() const {
    auto civil = detail::civil_from_days(day_);
    std::string result;
    int64_t y = civil.year;
    if (y < 0) {
      result += '-';
      y = -y;
    }
    // Pad to at least 4 digits
    std::string year_str = std::to_string(y);
    if (year_str.size() < 4) { year_str.insert(0, 4 - year_str.size(), '0'); }
    result += year_str;
    result += '-';
    result += static_cast<char>('0' + civil.month / 10);
    result += static_cast<char>('0' + civil.month % 10);
    result += '-';
    result += static_cast<char>('0' + civil.day / 10);
    result += static_cast<char>('0' + civil.day % 10);
    return result;
  }

  bool
  date::is_zero() const {
    return day_ == 0;
  }

  int32_t
  date::day_number() const {
    return day_;
  }

  int32_t
  date::year() const {
    return static_cast<int32_t>(detail::civil_from_days(day_).year);
  }

  uint8_t
  date::month() const {
    return detail::civil_from_days(day_).month;
  }

  uint8_t
  date::day() const {
    return detail::civil_from_days(day_).day;
  }

  int32_t
  date::year_day() const {
    auto civil = detail::civil_from_days(day_);
    return static_cast<int32_t>(
        day_ - detail::days_from_civil(civil.year, 1, 1) + 1);
  }

  std::chrono::weekday
  date::weekday() const {
    return std::chrono::weekday{std::chrono::sys_days{std::chrono::days{day_}}};
  }

  iso_week_date
  date::iso_week() const {
    // The ISO week belongs to the year containing its Thursday.
    int64_t iso_day = weekday().iso_encoding();
    int64_t thursday = int64_t{day_} + (4 - iso_day);
    auto civil = detail::civil_from_days(thursday);
    int64_t jan1 = detail::days_from_civil(civil.year, 1, 1);
    return {static_cast<int32_t>(civil.year),
            static_cast<int32_t>((thursday - jan1) / 7 + 1)};
  }

  date
  date::add(int32_t days) const {
    return from_day_number(checked_day_number(int64_t{day_} + days));
  }

  date
  date::add_date(int32_t years, int32_t months, int32_t days) const {
    auto civil = detail::civil_from_days(day_);
    return from_day_number(checked_day_number(
        normalised_day_number(civil.year + years, int64_t{civil.month} + months,
                              int64_t{civil.day} + days)));
  }

  int32_t
  date::sub(const date& other) const {
    return checked_day_number(int64_t{day_} - other.day_);
  }

  date::
  operator std::chrono::sys_days() const {
    return std::chrono::sys_days{std::chrono::days{day_}};
  }

} // namespace isoperiod
