#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE util
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "utils.h"
#include "times.h"

using namespace reckon;

struct times_fixture {
  times_fixture() {
    times_initialize();
  }
  ~times_fixture() {
    times_shutdown();
  }
};

BOOST_FIXTURE_TEST_SUITE(times, times_fixture)

BOOST_AUTO_TEST_CASE(testConstructors)
{
  date_t d0;
  date_t d1 = parse_date("2024-02-15");
  date_t d2 = parse_date("15/02/2024");
  date_t d3 = parse_date("15/02/24");
  date_t d4 = parse_date("15 Feb 2024");
  date_t d5 = parse_date("2024/02/15");
  date_t d6 = parse_date("15.02.2024");
  date_t d7 = parse_date("15-Feb-2024");

  BOOST_CHECK(d0.is_not_a_date());
  BOOST_CHECK(! is_valid(d0));

  date_t expected(2024, 2, 15);
  BOOST_CHECK_EQUAL(expected, d1);
  BOOST_CHECK_EQUAL(expected, d2);
  BOOST_CHECK_EQUAL(expected, d3);
  BOOST_CHECK_EQUAL(expected, d4);
  BOOST_CHECK_EQUAL(expected, d5);
  BOOST_CHECK_EQUAL(expected, d6);
  BOOST_CHECK_EQUAL(expected, d7);

  BOOST_CHECK(CURRENT_DATE() > d1);
}

BOOST_AUTO_TEST_CASE(testMonthFirstFallback)
{
  // Day-first is tried first, so only impossible day-first dates fall
  // through to month-first.
  BOOST_CHECK_EQUAL(date_t(2024, 1, 15), parse_date("01/15/2024"));
  BOOST_CHECK_EQUAL(date_t(2024, 5, 1), parse_date("01/05/2024"));
}

BOOST_AUTO_TEST_CASE(testInvalidDates)
{
  BOOST_CHECK_THROW(parse_date("not a date"), date_error);
  BOOST_CHECK_THROW(parse_date("31/02/2024"), date_error);
  BOOST_CHECK_THROW(parse_date(""), date_error);

  BOOST_CHECK(! try_parse_date(""));
  BOOST_CHECK(! try_parse_date("garbage"));
  BOOST_CHECK(try_parse_date(" 2025-01-10 "));
}

BOOST_AUTO_TEST_CASE(testFormatting)
{
  date_t when(2025, 1, 10);
  BOOST_CHECK_EQUAL(string("2025-01-10"), format_date(when, FMT_WRITTEN));
  BOOST_CHECK_EQUAL(string("2025-01-10"), format_date(when));
  BOOST_CHECK_EQUAL(string("10/01/2025"),
                    format_date(when, FMT_CUSTOM, "%d/%m/%Y"));
}

BOOST_AUTO_TEST_CASE(testMonthNames)
{
  BOOST_CHECK(string_to_month_of_year("February"));
  BOOST_CHECK_EQUAL(gregorian::Feb, *string_to_month_of_year("February"));
  BOOST_CHECK_EQUAL(gregorian::Sep, *string_to_month_of_year("sept"));
  BOOST_CHECK(! string_to_month_of_year("Smarch"));
}

BOOST_AUTO_TEST_SUITE_END()
