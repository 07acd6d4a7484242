#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE parser
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "config.h"
#include "parser.h"
#include "tabular.h"
#include "lineparse.h"

using namespace reckon;

namespace {
  string pad(const string& text, std::size_t width)
  {
    string result(text);
    result.resize(width, ' ');
    return result;
  }
}

struct parser_fixture {
  config_t        config;
  parse_context_t context;

  parser_fixture() : context(config, "statement.txt") {
    times_initialize();
    context.company_id = 1;
    context.period_id  = 1;
    context.linenum    = 1;
  }
  ~parser_fixture() {
    times_shutdown();
  }
};

BOOST_FIXTURE_TEST_SUITE(parser, parser_fixture)

BOOST_AUTO_TEST_CASE(testTabbedRow)
{
  tabular_parser_t parser;
  string line("ATM WITHDRAWAL\t\t200.00\t\t15/01/2025\t4,800.00");

  BOOST_CHECK(parser.can_parse(line, context));
  BOOST_CHECK(parser.is_tabular());

  optional<raw_fields_t> fields = parser.parse(line, context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("ATM WITHDRAWAL"), fields->description);
  BOOST_CHECK_EQUAL(amount_t("200.00"), *fields->debit);
  BOOST_CHECK(! fields->credit);
  BOOST_CHECK(! fields->service_fee);
  BOOST_CHECK_EQUAL(date_t(2025, 1, 15), *fields->date);
  BOOST_CHECK_EQUAL(amount_t("4800.00"), *fields->balance);
  BOOST_CHECK_EQUAL(string("tabular"), fields->parser);
  BOOST_CHECK_EQUAL(1U, fields->linenum);
}

BOOST_AUTO_TEST_CASE(testTabbedFeeMarker)
{
  tabular_parser_t parser;
  string line("MONTHLY FEE\t##\t35.00\t\t31/01/2025\t4,765.00");

  optional<raw_fields_t> fields = parser.parse(line, context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK(! fields->debit);
  BOOST_CHECK_EQUAL(amount_t("35.00"), *fields->service_fee);
}

BOOST_AUTO_TEST_CASE(testFixedWidthRow)
{
  tabular_parser_t parser;
  string line(pad("SALARY ACME CORP 1234567890", tabular_parser_t::DETAILS_END) +
              pad("", tabular_parser_t::SERVICE_FEE_END -
                  tabular_parser_t::DETAILS_END) +
              pad("", tabular_parser_t::DEBITS_END -
                  tabular_parser_t::SERVICE_FEE_END) +
              pad("25,000.00", tabular_parser_t::CREDITS_END -
                  tabular_parser_t::DEBITS_END) +
              pad("25/01/2025", tabular_parser_t::DATE_END -
                  tabular_parser_t::CREDITS_END) +
              "30,000.00");

  BOOST_CHECK(parser.can_parse(line, context));

  optional<raw_fields_t> fields = parser.parse(line, context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("SALARY ACME CORP 1234567890"), fields->description);
  BOOST_CHECK(! fields->debit);
  BOOST_CHECK_EQUAL(amount_t("25000.00"), *fields->credit);
  BOOST_CHECK_EQUAL(date_t(2025, 1, 25), *fields->date);
  BOOST_CHECK_EQUAL(amount_t("30000.00"), *fields->balance);
  BOOST_CHECK_EQUAL(string("1234567890"), *fields->reference);
}

BOOST_AUTO_TEST_CASE(testCompactRow)
{
  tabular_parser_t parser;
  BOOST_CHECK(context.scan_header("Statement from 16/02/2024 to 15/03/2024"));

  string line("POS PURCHASE SHOP 150.00- 03 05 5,850.00");
  BOOST_CHECK(parser.can_parse(line, context));

  optional<raw_fields_t> fields = parser.parse(line, context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("POS PURCHASE SHOP"), fields->description);
  BOOST_CHECK_EQUAL(amount_t("150.00"), *fields->debit);
  BOOST_CHECK_EQUAL(date_t(2024, 3, 5), *fields->date);
  BOOST_CHECK_EQUAL(amount_t("5850.00"), *fields->balance);
}

BOOST_AUTO_TEST_CASE(testCompactFirstRow)
{
  tabular_parser_t parser;
  context.scan_header("Statement from 16/02/2024 to 15/03/2024");
  BOOST_CHECK(! context.last_balance);

  optional<raw_fields_t> fields =
    parser.parse("IB PAYMENT TO ACME SUPPLIES 1,200.00- 03 15 45,300.00",
                 context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("IB PAYMENT TO ACME SUPPLIES"), fields->description);
  BOOST_REQUIRE(fields->debit);
  BOOST_CHECK_EQUAL(amount_t("1200.00"), *fields->debit);
  BOOST_CHECK(! fields->credit);
  BOOST_CHECK_EQUAL(date_t(2024, 3, 15), *fields->date);
  BOOST_CHECK_EQUAL(amount_t("45300.00"), *fields->balance);

  fields = parser.parse("MAGTAPE CREDIT 4 ABC LTD 1,000.00 02 20 6,000.00",
                        context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("MAGTAPE CREDIT 4 ABC LTD"), fields->description);
  BOOST_REQUIRE(fields->credit);
  BOOST_CHECK_EQUAL(amount_t("1000.00"), *fields->credit);
  BOOST_CHECK(! fields->debit);
}

BOOST_AUTO_TEST_CASE(testCompactBalanceOnly)
{
  tabular_parser_t parser;
  context.scan_header("Statement from 16/02/2024 to 15/03/2024");
  context.last_balance = amount_t("6000.00");

  optional<raw_fields_t> fields =
    parser.parse("SERVICE FEES ## 02 28 5,950.00", context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("SERVICE FEES"), fields->description);
  BOOST_CHECK_EQUAL(amount_t("50.00"), *fields->service_fee);
  BOOST_CHECK(! fields->debit);
  BOOST_CHECK(! fields->credit);
}

BOOST_AUTO_TEST_CASE(testContinuation)
{
  tabular_parser_t parser;
  string line("PAYMENT REF 12345678");

  // Without a preceding tabular row, a continuation has nothing to extend
  BOOST_CHECK(! parser.can_parse(line, context));

  raw_fields_t row;
  row.description = "MAGTAPE CREDIT ABC LTD";
  context.pending          = row;
  context.last_was_tabular = true;

  BOOST_CHECK(parser.can_parse(line, context));
  BOOST_CHECK(! parser.parse(line, context));
  BOOST_CHECK_EQUAL(string("MAGTAPE CREDIT ABC LTD PAYMENT REF 12345678"),
                    context.pending->description);
  BOOST_CHECK_EQUAL(string("12345678"), *context.pending->reference);

  BOOST_CHECK(! parser.can_parse("P.O. BOX 1234 JOHANNESBURG", context));
}

BOOST_AUTO_TEST_CASE(testCreditTransfer)
{
  credit_transfer_parser_t parser;
  string line("15/01/2025 CREDIT TRANSFER FROM ABC COMPANY 1,500.00");

  BOOST_CHECK(parser.can_parse(line, context));

  optional<raw_fields_t> fields = parser.parse(line, context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("CREDIT TRANSFER FROM ABC COMPANY"),
                    fields->description);
  BOOST_CHECK_EQUAL(amount_t("1500.00"), *fields->credit);
  BOOST_CHECK(! fields->debit);
  BOOST_CHECK_EQUAL(date_t(2025, 1, 15), *fields->date);

  BOOST_CHECK(! parser.can_parse("CREDIT CARD FEE 25.00", context));
  BOOST_CHECK(! parser.can_parse("ATM WITHDRAWAL 100.00", context));
  BOOST_CHECK(! parser.can_parse("DEPOSIT 100.00-", context));
}

BOOST_AUTO_TEST_CASE(testServiceFee)
{
  service_fee_parser_t parser;
  context.statement_date = date_t(2025, 1, 31);

  BOOST_CHECK(parser.can_parse("SERVICE FEE 35.00-", context));
  BOOST_CHECK(! parser.can_parse("SERVICE FEE", context));

  optional<raw_fields_t> fields = parser.parse("SERVICE FEE 35.00-", context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("SERVICE FEE"), fields->description);
  BOOST_CHECK_EQUAL(amount_t("35.00"), *fields->service_fee);
  BOOST_CHECK_EQUAL(string("FEE"), *fields->reference);
  BOOST_CHECK_EQUAL(date_t(2025, 1, 31), *fields->date);
  BOOST_CHECK(! fields->balance);

  fields = parser.parse("MONTHLY FEE ## 60.00 4,705.00", context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("MONTHLY FEE"), fields->description);
  BOOST_CHECK_EQUAL(amount_t("60.00"), *fields->service_fee);
  BOOST_CHECK_EQUAL(amount_t("4705.00"), *fields->balance);
}

BOOST_AUTO_TEST_CASE(testDebitCredit)
{
  debit_credit_parser_t parser;

  optional<raw_fields_t> fields =
    parser.parse("10/01/2025 POS PURCHASE SHOP 99.95 DR 1,000.00 CR", context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(string("POS PURCHASE SHOP"), fields->description);
  BOOST_CHECK_EQUAL(amount_t("99.95"), *fields->debit);
  BOOST_CHECK_EQUAL(amount_t("1000.00"), *fields->balance);

  fields = parser.parse("10/01/2025 ATM WITHDRAWAL 100.00", context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(amount_t("100.00"), *fields->debit);

  fields = parser.parse("10/01/2025 INTEREST EARNED 1.25 CR", context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(amount_t("1.25"), *fields->credit);

  fields = parser.parse("10/01/2025 OVERDRAWN 10.00- 50.00-", context);
  BOOST_REQUIRE(fields);
  BOOST_CHECK_EQUAL(amount_t("10.00"), *fields->debit);
  BOOST_CHECK_EQUAL(amount_t("-50.00"), *fields->balance);

  BOOST_CHECK(! parser.can_parse("12345 67.00", context));
  BOOST_CHECK_THROW(parser.parse("no amount here", context), parse_error);
}

BOOST_AUTO_TEST_CASE(testChainOrder)
{
  parser_chain_t chain;
  add_standard_parsers(chain);

  BOOST_CHECK_EQUAL(4U, chain.size());

  const parser_t * parser;

  parser = chain.find_parser("SERVICE FEE 35.00-", context);
  BOOST_REQUIRE(parser);
  BOOST_CHECK_EQUAL(string("service-fee"), string(parser->name()));

  parser = chain.find_parser("CREDIT TRANSFER FROM ABC 10.00", context);
  BOOST_REQUIRE(parser);
  BOOST_CHECK_EQUAL(string("credit-transfer"), string(parser->name()));

  parser = chain.find_parser("ATM WITHDRAWAL 100.00- 4,300.00", context);
  BOOST_REQUIRE(parser);
  BOOST_CHECK_EQUAL(string("debit-credit"), string(parser->name()));

  parser = chain.find_parser("ATM WITHDRAWAL\t\t200.00\t\t15/01/2025\t4,800.00",
                             context);
  BOOST_REQUIRE(parser);
  BOOST_CHECK_EQUAL(string("tabular"), string(parser->name()));

  BOOST_CHECK(! chain.find_parser("EFT REF 5566", context));
}

BOOST_AUTO_TEST_CASE(testHelpers)
{
  BOOST_CHECK_EQUAL(string("123456789"),
                    *extract_reference("EFT PAYMENT 123456789 ACME"));
  BOOST_CHECK(! extract_reference("REF 1234567"));

  BOOST_CHECK(! parse_amount_column("  ", "debits"));
  BOOST_CHECK_EQUAL(amount_t("12.00"), *parse_amount_column("12.00", "debits"));
  BOOST_CHECK_THROW(parse_amount_column("abc", "debits"), parse_error);
}

BOOST_AUTO_TEST_CASE(testMonthDayResolution)
{
  context.scan_header("Statement from 16/12/2024 to 15/01/2025");

  BOOST_CHECK_EQUAL(date_t(2025, 1, 5), context.resolve_month_day(1, 5));
  BOOST_CHECK_EQUAL(date_t(2024, 12, 20), context.resolve_month_day(12, 20));
  BOOST_CHECK_EQUAL(date_t(2025, 1, 15), *context.statement_date);
  BOOST_CHECK_THROW(context.resolve_month_day(13, 1), date_error);

  parse_context_t bare(config);
  BOOST_CHECK_EQUAL(date_t(config.default_year, 6, 30),
                    bare.resolve_month_day(6, 30));
}

BOOST_AUTO_TEST_SUITE_END()
