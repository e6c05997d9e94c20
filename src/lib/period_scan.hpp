#pragma once

#include <isoperiod/fixed_point.hpp>
#include <isoperiod/parse_error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace isoperiod::detail {

  // Components exactly as spelled, before weeks are folded into days.
  struct raw_period {
    bool negative = false;
    int64_t years = 0;
    int64_t months = 0;
    int64_t weeks = 0;
    int64_t days = 0;
    int64_t hours = 0;
    int64_t minutes = 0;
    int64_t milliseconds = 0;
  };

  // Text not yet consumed, and whether any field has matched so far. Each
  // extraction step takes a state and hands back the next one.
  struct scan_state {
    std::string_view rest;
    bool matched = false;
  };

  struct field_step {
    scan_state state;
    int64_t value = 0;
    std::optional<parse_error> error;
  };

  enum class field_unit { whole, fixed_point };

  inline std::string
  errc_detail(std::errc ec) {
    if (ec == std::errc::result_out_of_range) { return "out of range"; }
    return "not a number";
  }

  // Looks for `mark` in the remaining text. Absent: the field is zero and the
  // state is unchanged. At position zero: there is no number, which is an
  // error. Otherwise the text before the mark is the field's number.
  inline field_step
  extract_field(scan_state st, char mark, field_unit unit,
                std::string_view input) {
    field_step step{st, 0, std::nullopt};
    auto m = st.rest.find(mark);
    if (m == std::string_view::npos) { return step; }
    if (m == 0) {
      step.error = parse_error{parse_errc::missing_number, std::string(input),
                               mark, {}};
      return step;
    }

    auto parsed = parse_fixed_point(st.rest.substr(0, m));
    if (parsed.ec != std::errc{}) {
      step.error = parse_error{parse_errc::malformed_number,
                               std::string(input), mark,
                               errc_detail(parsed.ec)};
      return step;
    }

    if (unit == field_unit::whole) {
      if (parsed.value % fixed_point_scale != 0) {
        step.error = parse_error{parse_errc::malformed_number,
                                 std::string(input), mark,
                                 "fraction is only allowed on seconds"};
        return step;
      }
      step.value = parsed.value / fixed_point_scale;
    } else {
      step.value = parsed.value;
    }

    step.state.rest = st.rest.substr(m + 1);
    step.state.matched = true;
    return step;
  }

} // namespace isoperiod::detail
