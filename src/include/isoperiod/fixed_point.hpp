#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace isoperiod {

  // Fields are carried as integers scaled by 1000 (three decimal places).
  inline constexpr int64_t fixed_point_scale = 1000;

  struct fixed_point_result {
    int64_t value = 0;
    std::errc ec{};
  };

  // Parses an optionally signed decimal number using '.' or ',' as the
  // fractional separator. Only the first fractional digit is retained; any
  // further digits are truncated, never rounded. The parser knows nothing
  // about units.
  fixed_point_result
  parse_fixed_point(std::string_view text);

} // namespace isoperiod
