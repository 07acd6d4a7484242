#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE xact
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "xact.h"

using namespace reckon;

struct xact_fixture {
  raw_fields_t fields;

  xact_fixture() {
    times_initialize();

    fields.date        = date_t(2025, 1, 10);
    fields.description = "CREDIT TRANSFER from ABC Company";
    fields.debit       = amount_t(0L);
    fields.credit      = amount_t("1500.00");
  }

  ~xact_fixture() {
    times_shutdown();
  }
};

BOOST_FIXTURE_TEST_SUITE(xact_tests, xact_fixture)

BOOST_AUTO_TEST_CASE(testBuildCredit)
{
  standardized_xact_t xact(standardized_xact_t::build(fields));

  BOOST_CHECK_EQUAL(XACT_CREDIT, xact.type());
  BOOST_CHECK_EQUAL(amount_t("1500.00"), xact.amount());
  BOOST_CHECK_EQUAL(date_t(2025, 1, 10), xact.date());
  BOOST_CHECK_EQUAL(string("CREDIT TRANSFER from ABC Company"),
                    xact.description());
  BOOST_CHECK(xact.service_fee().is_zero());
  BOOST_CHECK(! xact.balance());
  BOOST_CHECK(! xact.reference());
  BOOST_CHECK(xact.valid());
}

BOOST_AUTO_TEST_CASE(testMissingDate)
{
  fields.date = none;

  try {
    standardized_xact_t::build(fields);
    BOOST_FAIL("build() accepted a transaction without a date");
  }
  catch (const build_error& err) {
    BOOST_CHECK_EQUAL(string("date"), err.field());
  }

  fields.date = date_t();
  BOOST_CHECK_THROW(standardized_xact_t::build(fields), build_error);
}

BOOST_AUTO_TEST_CASE(testMissingDescription)
{
  fields.description = "   ";

  try {
    standardized_xact_t::build(fields);
    BOOST_FAIL("build() accepted a transaction without a description");
  }
  catch (const build_error& err) {
    BOOST_CHECK_EQUAL(string("description"), err.field());
  }
}

BOOST_AUTO_TEST_CASE(testMissingAmountsAreZero)
{
  fields.debit  = none;
  fields.credit = none;

  standardized_xact_t xact(standardized_xact_t::build(fields));
  BOOST_CHECK(xact.debit().is_zero());
  BOOST_CHECK(xact.credit().is_zero());
  // "credit" in the description decides when there are no amounts
  BOOST_CHECK_EQUAL(XACT_CREDIT, xact.type());
}

BOOST_AUTO_TEST_CASE(testNegativeAmountsAreMagnitudes)
{
  fields.description = "POS PURCHASE";
  fields.debit       = amount_t("-45.00");
  fields.credit      = none;

  standardized_xact_t xact(standardized_xact_t::build(fields));
  BOOST_CHECK_EQUAL(amount_t("45.00"), xact.debit());
  BOOST_CHECK_EQUAL(XACT_DEBIT, xact.type());
  BOOST_CHECK(xact.valid());
}

BOOST_AUTO_TEST_CASE(testDetermineType)
{
  amount_t zero(0L);

  BOOST_CHECK_EQUAL(XACT_SERVICE_FEE,
                    determine_type(zero, zero, amount_t("35.00"), "SERVICE"));
  BOOST_CHECK_EQUAL(XACT_SERVICE_FEE,
                    determine_type(amount_t("20.00"), zero, zero,
                                   "ADMIN CHARGE"));
  BOOST_CHECK_EQUAL(XACT_DEBIT,
                    determine_type(amount_t("100.00"), zero, zero, "SHOP"));
  BOOST_CHECK_EQUAL(XACT_CREDIT,
                    determine_type(zero, amount_t("100.00"), zero, "SHOP"));
  BOOST_CHECK_EQUAL(XACT_DEBIT,
                    determine_type(zero, zero, zero, "ATM WITHDRAWAL"));
  BOOST_CHECK_EQUAL(XACT_CREDIT,
                    determine_type(zero, zero, zero, "SALARY"));
  BOOST_CHECK_EQUAL(XACT_CREDIT,
                    determine_type(amount_t("10.00"), amount_t("20.00"),
                                   zero, "SHOP"));
  BOOST_CHECK_EQUAL(XACT_DEBIT,
                    determine_type(amount_t("20.00"), amount_t("10.00"),
                                   zero, "SHOP"));
  BOOST_CHECK_EQUAL(XACT_CREDIT, determine_type(zero, zero, zero, "SHOP"));
}

BOOST_AUTO_TEST_CASE(testTypeIsDeterministic)
{
  standardized_xact_t x1(standardized_xact_t::build(fields));
  standardized_xact_t x2(standardized_xact_t::build(fields));

  BOOST_CHECK_EQUAL(x1.type(), x2.type());
  BOOST_CHECK_EQUAL(x1.type(),
                    determine_type(x1.debit(), x1.credit(), x1.service_fee(),
                                   x1.description()));
}

BOOST_AUTO_TEST_CASE(testFeeAmount)
{
  fields.description = "ADMIN CHARGE";
  fields.debit       = amount_t("20.00");
  fields.credit      = none;

  standardized_xact_t xact(standardized_xact_t::build(fields));
  BOOST_CHECK_EQUAL(XACT_SERVICE_FEE, xact.type());
  BOOST_CHECK_EQUAL(amount_t("20.00"), xact.amount());

  fields.description = "SERVICE FEE";
  fields.debit       = none;
  fields.service_fee = amount_t("35.00");
  fields.reference   = string("FEE");

  standardized_xact_t fee(standardized_xact_t::build(fields));
  BOOST_CHECK_EQUAL(XACT_SERVICE_FEE, fee.type());
  BOOST_CHECK_EQUAL(amount_t("35.00"), fee.amount());
  BOOST_CHECK_EQUAL(string("FEE"), *fee.reference());
}

BOOST_AUTO_TEST_CASE(testBankRow)
{
  fields.description = "SERVICE FEE";
  fields.debit       = amount_t("5.00");
  fields.credit      = none;
  fields.service_fee = amount_t("35.00");
  fields.balance     = amount_t("4265.00");

  standardized_xact_t xact(standardized_xact_t::build(fields));
  bank_xact_t         row(bank_xact_t::from(xact, 3, 7));

  BOOST_CHECK_EQUAL(0L, row.id);
  BOOST_CHECK_EQUAL(3L, row.company_id);
  BOOST_CHECK_EQUAL(7L, row.period_id);
  BOOST_CHECK_EQUAL(date_t(2025, 1, 10), row.date);
  BOOST_CHECK_EQUAL(string("SERVICE FEE"), row.details);
  BOOST_CHECK_EQUAL(amount_t("40.00"), row.debit);
  BOOST_CHECK(row.credit.is_zero());
  BOOST_CHECK_EQUAL(amount_t("4265.00"), *row.balance);
}

BOOST_AUTO_TEST_CASE(testPrint)
{
  fields.reference = string("12345678");
  standardized_xact_t xact(standardized_xact_t::build(fields));

  std::ostringstream out;
  out << xact;
  BOOST_CHECK(out.str().find("2025-01-10") == 0);
  BOOST_CHECK(out.str().find("CREDIT") != string::npos);
  BOOST_CHECK(out.str().find("1500.00") != string::npos);
  BOOST_CHECK(out.str().find("(12345678)") != string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
