#include <catch2/catch_test_macros.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

static const std::string isoperiod_cli = STRINGIFY(ISOPERIOD_CLI);

// Portable exit code extraction: WEXITSTATUS on POSIX, raw value on Windows
static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static std::string
slurp(const fs::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

static int
run_cli(const std::string& args) {
  std::string cmd = isoperiod_cli + " " + args + " >/dev/null 2>/dev/null";
  return exit_code(std::system(cmd.c_str()));
}

static int
run_cli_stderr(const std::string& args, std::string& stderr_output) {
  auto tmp = fs::temp_directory_path() / "isoperiod_cli_stderr.txt";
  std::string cmd =
      isoperiod_cli + " " + args + " >/dev/null 2>" + tmp.string();
  int rc = exit_code(std::system(cmd.c_str()));
  stderr_output = slurp(tmp);
  fs::remove(tmp);
  return rc;
}

static int
run_cli_stdout(const std::string& args, std::string& stdout_output) {
  auto tmp = fs::temp_directory_path() / "isoperiod_cli_stdout.txt";
  std::string cmd =
      isoperiod_cli + " " + args + " >" + tmp.string() + " 2>/dev/null";
  int rc = exit_code(std::system(cmd.c_str()));
  stdout_output = slurp(tmp);
  fs::remove(tmp);
  return rc;
}

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--help", err);
  CHECK(rc == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("-h exits 0", "[cli]") {
  CHECK(run_cli("-h") == 0);
}

TEST_CASE("--version exits 0 and contains version", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--version", err);
  CHECK(rc == 0);
  CHECK(err.find("isoperiod") != std::string::npos);
}

TEST_CASE("no arguments exits 1 (usage error)", "[cli]") {
  CHECK(run_cli("") == 1);
}

TEST_CASE("unknown option exits 1", "[cli]") {
  std::string err;
  CHECK(run_cli_stderr("--bogus P1D", err) == 1);
  CHECK(err.find("unknown option") != std::string::npos);
}

TEST_CASE("periods are printed in canonical form", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("P24M P1W PT1,5S P0", out);
  CHECK(rc == 0);
  CHECK(out == "P2Y\nP7D\nPT1.5S\nP0D\n");
}

TEST_CASE("signed periods are not taken for options", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("-P1D +P2D", out);
  CHECK(rc == 0);
  CHECK(out == "-P1D\nP2D\n");
}

TEST_CASE("--no-normalise keeps months as spelled", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("--no-normalise P24M", out);
  CHECK(rc == 0);
  CHECK(out == "P24M\n");
}

TEST_CASE("--components prints each field", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("--components -P1Y2M3DT4H5M6.7S", out);
  CHECK(rc == 0);
  CHECK(out == "negative=true years=1 months=2 days=3 hours=4 minutes=5 "
               "milliseconds=6700\n");
}

TEST_CASE("invalid period exits 3 and names the error", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("PY", err);
  CHECK(rc == 3);
  CHECK(err.find("missing_number") != std::string::npos);
  CHECK(err.find("'Y'") != std::string::npos);
}

TEST_CASE("valid periods are still printed alongside invalid ones", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("P1D P P2D", out);
  CHECK(rc == 3);
  CHECK(out == "P1D\nP2D\n");
}

TEST_CASE("date subcommand prints calendar details", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("date 2024-01-15", out);
  CHECK(rc == 0);
  CHECK(out == "2024-01-15 day=19737 weekday=Monday iso_week=2024-W3\n");
}

TEST_CASE("date subcommand --add offsets the date", "[cli]") {
  std::string out;
  int rc = run_cli_stdout("date --add -1 2024-03-01", out);
  CHECK(rc == 0);
  CHECK(out.rfind("2024-02-29 ", 0) == 0);
}

TEST_CASE("date subcommand rejects invalid dates", "[cli]") {
  CHECK(run_cli("date 2024-02-30") == 3);
  CHECK(run_cli("date") == 1);
  CHECK(run_cli("date --add") == 1);
  CHECK(run_cli("date --add x 2024-01-01") == 1);
  CHECK(run_cli("date --add 5x 2024-01-01") == 1);
}
