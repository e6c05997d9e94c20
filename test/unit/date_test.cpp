#include <isoperiod/date.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

using isoperiod::date;

TEST_CASE("date default construction is 1970-01-01", "[date]") {
  date d;
  CHECK(d.is_zero());
  CHECK(d.day_number() == 0);
  CHECK(d.year() == 1970);
  CHECK(d.month() == 1);
  CHECK(d.day() == 1);
  CHECK(d.weekday() == std::chrono::Thursday);
  CHECK(d.to_string() == "1970-01-01");
}

TEST_CASE("date string parsing", "[date]") {
  SECTION("basic date") {
    date d("2024-01-15");
    CHECK(d.year() == 2024);
    CHECK(d.month() == 1);
    CHECK(d.day() == 15);
    CHECK(d.day_number() == 19737);
    CHECK(d.to_string() == "2024-01-15");
  }
  SECTION("before the epoch") {
    date d("1969-12-31");
    CHECK(d.day_number() == -1);
    CHECK_FALSE(d.is_zero());
  }
  SECTION("leap day") { CHECK(date("2000-02-29").day_number() == 11016); }
  SECTION("year 0000") {
    date d("0000-03-01");
    CHECK(d.year() == 0);
    CHECK(d.to_string() == "0000-03-01");
  }
  SECTION("negative year") {
    date d("-0001-01-01");
    CHECK(d.year() == -1);
    CHECK(d.to_string() == "-0001-01-01");
  }
  SECTION("five digit year") {
    date d("12345-06-07");
    CHECK(d.year() == 12345);
    CHECK(d.to_string() == "12345-06-07");
  }
}

TEST_CASE("date invalid string parsing throws", "[date]") {
  CHECK_THROWS_AS(date(""), std::invalid_argument);
  CHECK_THROWS_AS(date("2024"), std::invalid_argument);
  CHECK_THROWS_AS(date("24-01-15"), std::invalid_argument);
  CHECK_THROWS_AS(date("2024-1-15"), std::invalid_argument);
  CHECK_THROWS_AS(date("2024-13-01"), std::invalid_argument);
  CHECK_THROWS_AS(date("2024-02-30"), std::invalid_argument);
  CHECK_THROWS_AS(date("2023-02-29"), std::invalid_argument);
  CHECK_THROWS_AS(date("2024-01-15Z"), std::invalid_argument);
  CHECK_THROWS_AS(date("99999999999-01-01"), std::invalid_argument);
  CHECK_THROWS_AS(date("9999999999-01-01"), std::out_of_range);
}

TEST_CASE("date component construction normalises", "[date]") {
  CHECK(date(2024, 1, 15) == date("2024-01-15"));
  CHECK(date(2023, 14, 1) == date("2024-02-01"));
  CHECK(date(2024, 3, 0) == date("2024-02-29"));
  CHECK(date(2024, 0, 1) == date("2023-12-01"));
  CHECK(date(2024, -11, 1) == date("2023-01-01"));
  CHECK(date(2023, 12, 32) == date("2024-01-01"));
  CHECK(date(1970, 1, 1).is_zero());
}

TEST_CASE("date range limits", "[date]") {
  CHECK(date::min().to_string() == "-5877641-06-23");
  CHECK(date::min().weekday() == std::chrono::Tuesday);
  CHECK(date::max().to_string() == "5881580-07-11");
  CHECK(date::max().weekday() == std::chrono::Friday);
  CHECK_THROWS_AS(date::max().add(1), std::out_of_range);
  CHECK_THROWS_AS(date::min().add(-1), std::out_of_range);
  CHECK_THROWS_AS(date(6000000, 1, 1), std::out_of_range);
}

TEST_CASE("date calendar queries", "[date]") {
  SECTION("weekday") {
    CHECK(date("2024-01-15").weekday() == std::chrono::Monday);
    CHECK(date("2000-02-29").weekday() == std::chrono::Tuesday);
    CHECK(date("1969-12-31").weekday() == std::chrono::Wednesday);
  }
  SECTION("year_day") {
    CHECK(date("2024-01-01").year_day() == 1);
    CHECK(date("2024-12-31").year_day() == 366);
    CHECK(date("2023-12-31").year_day() == 365);
    CHECK(date("2024-03-01").year_day() == 61);
  }
  SECTION("iso_week") {
    CHECK(date("2024-01-15").iso_week() == isoperiod::iso_week_date{2024, 3});
    CHECK(date("2021-01-01").iso_week() == isoperiod::iso_week_date{2020, 53});
    CHECK(date("2019-12-30").iso_week() == isoperiod::iso_week_date{2020, 1});
    CHECK(date("1969-12-31").iso_week() == isoperiod::iso_week_date{1970, 1});
  }
}

TEST_CASE("date arithmetic", "[date]") {
  SECTION("add days") {
    CHECK(date("2024-02-28").add(1) == date("2024-02-29"));
    CHECK(date("2024-02-28").add(2) == date("2024-03-01"));
    CHECK(date("2024-01-01").add(-1) == date("2023-12-31"));
  }
  SECTION("add_date") {
    CHECK(date("2011-01-01").add_date(-1, 2, 3) == date("2010-03-04"));
    CHECK(date("2024-01-31").add_date(0, 1, 0) == date("2024-03-02"));
    CHECK(date("2024-02-29").add_date(1, 0, 0) == date("2025-03-01"));
  }
  SECTION("sub") {
    CHECK(date("2024-03-01").sub(date("2024-02-01")) == 29);
    CHECK(date("2024-02-01").sub(date("2024-03-01")) == -29);
    CHECK(date::max().sub(date::max()) == 0);
    CHECK_THROWS_AS(date::max().sub(date::min()), std::out_of_range);
  }
}

TEST_CASE("date comparison", "[date]") {
  CHECK(date("2024-01-01") < date("2024-01-02"));
  CHECK(date("2024-01-02") > date("2024-01-01"));
  CHECK(date("-0001-12-31") < date("0000-01-01"));
  CHECK(date("2024-01-01") != date("2024-01-02"));
  CHECK(date::min() < date::max());
}

TEST_CASE("date chrono conversion", "[date]") {
  using namespace std::chrono;
  sys_days sd = sys_days{year{2024} / January / 15};
  date d(sd);
  CHECK(d == date("2024-01-15"));
  CHECK(static_cast<sys_days>(d) == sd);
}

TEST_CASE("date hash and stream output", "[date]") {
  std::unordered_map<date, int> m;
  m[date("2024-01-15")] = 1;
  m[date(2024, 1, 15)] = 2;
  CHECK(m.size() == 1);

  std::ostringstream os;
  os << date("2024-01-15");
  CHECK(os.str() == "2024-01-15");
}
