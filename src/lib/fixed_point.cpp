#include <isoperiod/fixed_point.hpp>

#include <charconv>
#include <string>

namespace isoperiod {

  namespace {

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    bool
    all_digits(std::string_view str) {
      for (char c : str) {
        if (!is_digit(c)) { return false; }
      }
      return true;
    }

  } // namespace

  fixed_point_result
  parse_fixed_point(std::string_view text) {
    std::string digits;
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
      if (text[pos] == '-') { digits += '-'; }
      ++pos;
    }

    auto body = text.substr(pos);
    auto dec = body.find('.');
    if (dec == std::string_view::npos) { dec = body.find(','); }

    auto whole = body.substr(0, dec);
    if (whole.empty() || !all_digits(whole)) {
      return {0, std::errc::invalid_argument};
    }
    digits += whole;

    if (dec == std::string_view::npos) {
      digits += "000";
    } else {
      auto frac = body.substr(dec + 1);
      if (!all_digits(frac)) { return {0, std::errc::invalid_argument}; }
      if (frac.empty()) {
        digits += "000";
      } else {
        // Tenths only; the remaining digits are dropped.
        digits += frac.front();
        digits += "00";
      }
    }

    fixed_point_result result;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, result.value);
    if (ec != std::errc{}) { return {0, ec}; }
    if (ptr != last) { return {0, std::errc::invalid_argument}; }
    return result;
  }

} // namespace isoperiod
