#include <isoperiod/parse_error.hpp>

#include <utility>

namespace isoperiod {

  std::string_view
  to_string(parse_errc kind) {
    switch (kind) {
      case parse_errc::empty_or_sign_only:
        return "empty_or_sign_only";
      case parse_errc::missing_period_marker:
        return "missing_period_marker";
      case parse_errc::missing_number:
        return "missing_number";
      case parse_errc::malformed_number:
        return "malformed_number";
      case parse_errc::trailing_text:
        return "trailing_text";
      case parse_errc::no_fields:
        return "no_fields";
    }
    return "unknown";
  }

  std::ostream&
  operator<<(std::ostream& os, parse_errc kind) {
    return os << to_string(kind);
  }

  std::string
  parse_error::message() const {
    std::string result = "period: ";
    switch (kind) {
      case parse_errc::empty_or_sign_only:
        result += "cannot parse a blank string as a period";
        break;
      case parse_errc::missing_period_marker:
        result += "expected 'P' period mark at the start";
        break;
      case parse_errc::missing_number:
        result += "expected a number before the '";
        result += designator;
        result += "' designator";
        break;
      case parse_errc::malformed_number:
        result += "invalid number before the '";
        result += designator;
        result += "' designator";
        if (!detail.empty()) {
          result += " (";
          result += detail;
          result += ')';
        }
        break;
      case parse_errc::trailing_text:
        result += "unexpected remaining components ";
        result += detail;
        break;
      case parse_errc::no_fields:
        result += "expected 'Y', 'M', 'W', 'D', 'H', 'M', or 'S' designator";
        break;
    }
    result += ": ";
    result += input;
    return result;
  }

  period_error::period_error(parse_error error)
      : std::invalid_argument(error.message()), error_(std::move(error)) {}

  const parse_error&
  period_error::error() const noexcept {
    return error_;
  }

  parse_errc
  period_error::kind() const noexcept {
    return error_.kind;
  }

} // namespace isoperiod
