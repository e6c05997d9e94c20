#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace isoperiod {

  enum class parse_errc {
    empty_or_sign_only,
    missing_period_marker,
    missing_number,
    malformed_number,
    trailing_text,
    no_fields,
  };

  std::string_view
  to_string(parse_errc kind);

  std::ostream&
  operator<<(std::ostream& os, parse_errc kind);

  struct parse_error {
    parse_errc kind = parse_errc::no_fields;
    // The complete text handed to the parser.
    std::string input;
    // Designator being parsed when the failure was detected, or '\0'.
    char designator = '\0';
    // Offending fragment or underlying cause; may be empty.
    std::string detail;

    std::string
    message() const;

    bool
    operator==(const parse_error& other) const = default;
  };

  // Thrown by the throwing entry points (must_parse, period's string
  // constructor).
  class period_error : public std::invalid_argument {
    parse_error error_;

  public:
    explicit period_error(parse_error error);

    const parse_error&
    error() const noexcept;
    parse_errc
    kind() const noexcept;
  };

} // namespace isoperiod
