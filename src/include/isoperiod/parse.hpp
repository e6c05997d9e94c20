#pragma once

#include <isoperiod/parse_error.hpp>
#include <isoperiod/period.hpp>

#include <string_view>
#include <variant>

namespace isoperiod {

  // Either a parsed period or the reason the text was rejected.
  class parse_result {
    std::variant<period, parse_error> value_;

  public:
    parse_result(period value);
    parse_result(parse_error error);

    bool
    has_value() const;
    explicit
    operator bool() const;

    // Throws period_error if the parse failed.
    const period&
    value() const;
    // Throws std::logic_error if the parse succeeded.
    const parse_error&
    error() const;
  };

  // Parses an ISO-8601 period such as "P1Y2M3W4DT5H6M7.8S", optionally
  // preceded by '+' or '-'. The literal "P0" is also accepted as zero.
  //
  // By default the result is normalised: whole multiples of 12 months become
  // years, so "P24M" equals "P2Y". Nothing else is carried, because a day is
  // not a fixed fraction of a month.
  parse_result
  parse(std::string_view text, bool normalise = true);

  parse_result
  parse_strict(std::string_view text, bool normalise);

  // As parse(), but throws period_error on failure. Meant for literals in
  // setup code; left uncaught, the exception terminates the process. Do not
  // use it on untrusted input.
  period
  must_parse(std::string_view text, bool normalise = true);

} // namespace isoperiod
