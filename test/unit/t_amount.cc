#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE amount
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "amount.h"

using namespace reckon;

struct amount_fixture {
  amount_fixture() {}
  ~amount_fixture() {}
};

BOOST_FIXTURE_TEST_SUITE(amount, amount_fixture)

BOOST_AUTO_TEST_CASE(testConstructors)
{
  amount_t x0;
  amount_t x1(123456L);
  amount_t x2("123.456");
  amount_t x3(string("1,500.00"));
  amount_t x4(x2);

  BOOST_CHECK(x0.is_null());
  BOOST_CHECK(x0.is_zero());
  BOOST_CHECK(! x1.is_null());
  BOOST_CHECK_EQUAL(string("123456.00"), x1.to_string());
  BOOST_CHECK_EQUAL(string("123.456"), x2.to_string());
  BOOST_CHECK_EQUAL(string("1500.00"), x3.to_string());
  BOOST_CHECK_EQUAL(x2, x4);
  BOOST_CHECK_EQUAL(3, x2.precision());

  BOOST_CHECK(x0.valid());
  BOOST_CHECK(x1.valid());
  BOOST_CHECK(x2.valid());
  BOOST_CHECK(x3.valid());
}

BOOST_AUTO_TEST_CASE(testStatementNotation)
{
  BOOST_CHECK_EQUAL(amount_t("-35.00"), amount_t("35.00-"));
  BOOST_CHECK_EQUAL(amount_t("-12.50"), amount_t("(12.50)"));
  BOOST_CHECK_EQUAL(amount_t("100.00"), amount_t("100.00CR"));
  BOOST_CHECK_EQUAL(amount_t("-100.00"), amount_t("100.00 DR"));
  BOOST_CHECK_EQUAL(amount_t("1234.56"), amount_t("R 1 234.56"));
  BOOST_CHECK_EQUAL(amount_t("12.00"), amount_t("$12.00"));
  BOOST_CHECK_EQUAL(amount_t("5.00"), amount_t("ZAR 5.00"));
  BOOST_CHECK_EQUAL(amount_t("-50.00"), amount_t("-R 50.00"));
  BOOST_CHECK_EQUAL(amount_t("1234567.89"), amount_t("1,234,567.89"));
  BOOST_CHECK_EQUAL(string("1234.00"), amount_t("1,234").to_string());
  BOOST_CHECK_EQUAL(string("35.00"), amount_t("35").to_string());
  BOOST_CHECK_EQUAL(string("-35.00"), amount_t("35.00-").to_string());
}

BOOST_AUTO_TEST_CASE(testParseErrors)
{
  BOOST_CHECK_THROW(amount_t(""), amount_error);
  BOOST_CHECK_THROW(amount_t("   "), amount_error);
  BOOST_CHECK_THROW(amount_t("abc"), amount_error);
  BOOST_CHECK_THROW(amount_t("12.345.67"), amount_error);
  BOOST_CHECK_THROW(amount_t("1,23"), amount_error);

  BOOST_CHECK(! parse_amount_text("n/a"));
  BOOST_CHECK(! parse_amount_text(""));
  BOOST_CHECK(parse_amount_text("4,300.00"));
  BOOST_CHECK_EQUAL(amount_t("4300.00"), *parse_amount_text("4,300.00"));
}

BOOST_AUTO_TEST_CASE(testArithmetic)
{
  amount_t x1("0.10");
  amount_t x2("0.20");

  // Decimal figures are exact, unlike binary floating point
  BOOST_CHECK_EQUAL(amount_t("0.30"), x1 + x2);
  BOOST_CHECK_EQUAL(amount_t("-0.10"), x1 - x2);

  amount_t x3("443053.92");
  x3 -= amount_t("512103.68");
  BOOST_CHECK_EQUAL(amount_t("-69049.76"), x3);
  BOOST_CHECK_EQUAL(amount_t("69049.76"), x3.abs());
  BOOST_CHECK_EQUAL(amount_t("69049.76"), -x3);

  amount_t x4(10L);
  x4 += 5L;
  BOOST_CHECK(x4 == 15L);
  BOOST_CHECK(x4 > 14L);
  BOOST_CHECK(x4 < 16L);

  amount_t x5;
  x5 += amount_t("1.25");
  BOOST_CHECK(! x5.is_null());
  BOOST_CHECK_EQUAL(string("1.25"), x5.to_string());

  BOOST_CHECK(x1.valid());
  BOOST_CHECK(x3.valid());
  BOOST_CHECK(x5.valid());
}

BOOST_AUTO_TEST_CASE(testSign)
{
  BOOST_CHECK_EQUAL(0, amount_t(0L).sign());
  BOOST_CHECK_EQUAL(1, amount_t("0.01").sign());
  BOOST_CHECK_EQUAL(-1, amount_t("0.01-").sign());
  BOOST_CHECK(amount_t("0.00").is_zero());
  BOOST_CHECK(amount_t("0.01").is_nonzero());

  BOOST_CHECK(amount_t("9.99") < amount_t("10.00"));
  BOOST_CHECK(amount_t("10.00") == amount_t("10"));
}

BOOST_AUTO_TEST_CASE(testValueOrZero)
{
  optional<amount_t> missing;
  optional<amount_t> present(amount_t("2.50"));

  BOOST_CHECK(value_or_zero(missing).is_zero());
  BOOST_CHECK(! value_or_zero(missing).is_null());
  BOOST_CHECK_EQUAL(amount_t("2.50"), value_or_zero(present));
}

BOOST_AUTO_TEST_SUITE_END()
