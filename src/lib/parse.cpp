#include <isoperiod/parse.hpp>

#include "period_scan.hpp"

#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace isoperiod {

  namespace {

    struct part_field {
      char mark;
      detail::field_unit unit;
      int64_t detail::raw_period::*slot;
    };

    constexpr part_field time_fields[] = {
        {'H', detail::field_unit::whole, &detail::raw_period::hours},
        {'M', detail::field_unit::whole, &detail::raw_period::minutes},
        {'S', detail::field_unit::fixed_point,
         &detail::raw_period::milliseconds},
    };

    constexpr part_field date_fields[] = {
        {'Y', detail::field_unit::whole, &detail::raw_period::years},
        {'M', detail::field_unit::whole, &detail::raw_period::months},
        {'W', detail::field_unit::whole, &detail::raw_period::weeks},
        {'D', detail::field_unit::whole, &detail::raw_period::days},
    };

    struct part_step {
      detail::scan_state state;
      std::optional<parse_error> error;
    };

    // Extracts each field of one part in order, then requires that nothing
    // is left over. `part` names the part in trailing-text errors.
    template <std::size_t N>
    part_step
    scan_part(detail::scan_state st, const part_field (&fields)[N], char part,
              detail::raw_period& raw, std::string_view input) {
      for (const auto& field : fields) {
        auto step = detail::extract_field(st, field.mark, field.unit, input);
        if (step.error) { return {st, std::move(step.error)}; }
        raw.*field.slot = step.value;
        st = step.state;
      }
      if (!st.rest.empty()) {
        return {st, parse_error{parse_errc::trailing_text, std::string(input),
                                part, std::string(st.rest)}};
      }
      return {st, std::nullopt};
    }

    parse_error
    make_error(parse_errc kind, std::string_view input, char designator) {
      return parse_error{kind, std::string(input), designator, {}};
    }

  } // namespace

  parse_result::parse_result(period value) : value_(std::move(value)) {}

  parse_result::parse_result(parse_error error) : value_(std::move(error)) {}

  bool
  parse_result::has_value() const {
    return std::holds_alternative<period>(value_);
  }

  parse_result::operator bool() const {
    return has_value();
  }

  const period&
  parse_result::value() const {
    if (const auto* err = std::get_if<parse_error>(&value_)) {
      throw period_error(*err);
    }
    return std::get<period>(value_);
  }

  const parse_error&
  parse_result::error() const {
    if (has_value()) {
      throw std::logic_error("parse_result: no error, parse succeeded");
    }
    return std::get<parse_error>(value_);
  }

  parse_result
  parse(std::string_view text, bool normalise) {
    return parse_strict(text, normalise);
  }

  parse_result
  parse_strict(std::string_view text, bool normalise) {
    if (text.empty() || text == "-" || text == "+") {
      return make_error(parse_errc::empty_or_sign_only, text, '\0');
    }

    if (text == "P0") { return period(); }

    detail::raw_period raw;
    auto rest = text;
    if (rest.front() == '-') {
      raw.negative = true;
      rest.remove_prefix(1);
    } else if (rest.front() == '+') {
      rest.remove_prefix(1);
    }

    if (rest.front() != 'P') {
      return make_error(parse_errc::missing_period_marker, text, 'P');
    }
    rest.remove_prefix(1);

    detail::scan_state st{rest, false};
    auto t = rest.find('T');
    if (t != std::string_view::npos) {
      st.rest = rest.substr(t + 1);
      auto time_part = scan_part(st, time_fields, 'T', raw, text);
      if (time_part.error) { return std::move(*time_part.error); }
      st = time_part.state;
      st.rest = rest.substr(0, t);
    }

    auto date_part = scan_part(st, date_fields, 'P', raw, text);
    if (date_part.error) { return std::move(*date_part.error); }
    st = date_part.state;

    if (!st.matched) { return make_error(parse_errc::no_fields, text, '\0'); }

    // Folded days must stay within the range a 'D' field can spell.
    constexpr int64_t max_days =
        std::numeric_limits<int64_t>::max() / fixed_point_scale;
    int64_t days = raw.weeks * 7 + raw.days;
    if (days > max_days || days < -max_days) {
      return parse_error{parse_errc::malformed_number, std::string(text), 'W',
                         "out of range"};
    }

    period result(raw.years, raw.months, days, raw.hours,
                  raw.minutes, raw.milliseconds, raw.negative);
    if (normalise) { return result.normalise(); }
    return result;
  }

  period
  must_parse(std::string_view text, bool normalise) {
    return parse_strict(text, normalise).value();
  }

} // namespace isoperiod
