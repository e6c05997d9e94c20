#include <isoperiod/date.hpp>
#include <isoperiod/parse.hpp>
#include <isoperiod/period.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_parse = 3;

struct cli_options {
  std::vector<std::string> periods;
  bool normalise = true;
  bool components = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: isoperiod [options] <period> [period2 ...]\n"
     << "       isoperiod date [options] <YYYY-MM-DD> [...]\n"
     << "\n"
     << "Parses ISO-8601 periods such as P1Y2M3DT4H5M6.7S and prints each\n"
     << "in canonical form, one per line.\n"
     << "\n"
     << "Options:\n"
     << "  --no-normalise    Keep months as spelled (P24M stays P24M)\n"
     << "  --components      Print each component instead of the period\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "isoperiod " << ISOPERIOD_VERSION << "\n";
}

// A leading '-' is an option unless it starts a signed period ("-P1D").
static bool
is_option(const std::string& arg) {
  return arg.size() > 1 && arg[0] == '-' && arg[1] != 'P';
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!options_done && is_option(arg)) {
      if (arg == "-h" || arg == "--help") {
        opts.show_help = true;
        return opts;
      }

      if (arg == "--version") {
        opts.show_version = true;
        return opts;
      }

      if (arg == "--no-normalise") {
        opts.normalise = false;
        continue;
      }

      if (arg == "--components") {
        opts.components = true;
        continue;
      }

      if (arg == "--") {
        options_done = true;
        continue;
      }

      std::cerr << "isoperiod: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.periods.push_back(arg);
  }

  return opts;
}

static void
print_components(std::ostream& os, const isoperiod::period& p) {
  os << "negative=" << (p.is_negative() ? "true" : "false")
     << " years=" << p.years() << " months=" << p.months()
     << " days=" << p.days() << " hours=" << p.hours()
     << " minutes=" << p.minutes() << " milliseconds=" << p.milliseconds()
     << "\n";
}

static int
run(const cli_options& opts) {
  int rc = exit_success;
  for (const auto& text : opts.periods) {
    auto result = isoperiod::parse_strict(text, opts.normalise);
    if (!result) {
      std::cerr << "isoperiod: " << result.error().kind << ": "
                << result.error().message() << "\n";
      rc = exit_parse;
      continue;
    }
    if (opts.components) {
      print_components(std::cout, result.value());
    } else {
      std::cout << result.value() << "\n";
    }
  }
  return rc;
}

// ---------------------------------------------------------------------------
// date subcommand
// ---------------------------------------------------------------------------

struct date_options {
  std::vector<std::string> dates;
  int32_t add_days = 0;
  bool show_help = false;
};

static void
print_date_usage(std::ostream& os) {
  os << "Usage: isoperiod date [options] <YYYY-MM-DD> [...]\n"
     << "\n"
     << "Prints each date with its day number, weekday and ISO week.\n"
     << "\n"
     << "Options:\n"
     << "  --add <N>         Add N days (may be negative) before printing\n"
     << "  -h, --help        Show this help message\n";
}

static date_options
parse_date_args(int argc, char* argv[]) {
  date_options opts;

  // argv[0] is "isoperiod", argv[1] is "date", start at 2
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--add") {
      if (i + 1 >= argc) {
        std::cerr << "isoperiod date: --add requires an argument\n";
        std::exit(exit_usage);
      }
      std::string_view count = argv[++i];
      auto [ptr, ec] = std::from_chars(count.data(),
                                       count.data() + count.size(),
                                       opts.add_days);
      if (ec != std::errc{} || ptr != count.data() + count.size()) {
        std::cerr << "isoperiod date: --add expects a day count: " << count
                  << "\n";
        std::exit(exit_usage);
      }
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-' && (arg[1] < '0' || arg[1] > '9')) {
      std::cerr << "isoperiod date: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.dates.push_back(arg);
  }

  return opts;
}

static int
run_date(const date_options& opts) {
  static constexpr const char* weekday_names[] = {
      "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday",
      "Saturday"};

  int rc = exit_success;
  for (const auto& text : opts.dates) {
    try {
      auto d = isoperiod::date(text).add(opts.add_days);
      auto week = d.iso_week();
      std::cout << d << " day=" << d.day_number()
                << " weekday=" << weekday_names[d.weekday().c_encoding()]
                << " iso_week=" << week.year << "-W" << week.week << "\n";
    } catch (const std::exception& e) {
      std::cerr << "isoperiod date: " << text << ": " << e.what() << "\n";
      rc = exit_parse;
    }
  }
  return rc;
}

int
main(int argc, char* argv[]) {
  if (argc >= 2 && std::string(argv[1]) == "date") {
    auto opts = parse_date_args(argc, argv);

    if (opts.show_help) {
      print_date_usage(std::cerr);
      return exit_success;
    }

    if (opts.dates.empty()) {
      std::cerr << "isoperiod date: no dates specified\n";
      print_date_usage(std::cerr);
      return exit_usage;
    }

    return run_date(opts);
  }

  auto opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.periods.empty()) {
    std::cerr << "isoperiod: no periods specified\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
