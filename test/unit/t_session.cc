#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE session
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "config.h"
#include "session.h"
#include "report.h"

using namespace reckon;

struct session_fixture {
  config_t                   config;
  memory_transaction_store_t store;
  std::vector<string>        statement;

  session_fixture() : store(config) {
    times_initialize();

    config.company_id = 1;
    config.period_id  = 1;

    statement.push_back("Statement from 01/01/2025 to 31/01/2025");
    statement.push_back("Page 1 of 2");
    statement.push_back("");
    statement.push_back("2025-01-10 ATM WITHDRAWAL 100.00- 4300.00");
    statement.push_back("2025-01-15 CREDIT TRANSFER FROM ABC COMPANY 1,500.00");
    statement.push_back("SERVICE FEE 35.00-");
    statement.push_back("Thank you for banking with us");
    statement.push_back("EFT REF 5566");
  }

  ~session_fixture() {
    times_shutdown();
  }
};

BOOST_FIXTURE_TEST_SUITE(session, session_fixture)

BOOST_AUTO_TEST_CASE(testIngestStatement)
{
  session_t       session(config, store);
  import_result_t result(session.ingest(statement, "january.txt"));

  BOOST_CHECK_EQUAL(string("january.txt"), result.source);
  BOOST_REQUIRE_EQUAL(3U, result.accepted.size());
  BOOST_CHECK(result.duplicates.empty());
  BOOST_CHECK(result.build_errors.empty());
  BOOST_CHECK_EQUAL(3U, result.noise_lines);
  BOOST_CHECK_EQUAL(1U, result.other_lines);

  BOOST_REQUIRE_EQUAL(1U, result.unparsed.size());
  BOOST_CHECK_EQUAL(8U, result.unparsed[0].linenum);
  BOOST_CHECK_EQUAL(string("EFT REF 5566"), result.unparsed[0].text);

  const standardized_xact_t& atm(result.accepted[0].xact);
  BOOST_CHECK_EQUAL(4U, result.accepted[0].linenum);
  BOOST_CHECK_EQUAL(XACT_DEBIT, atm.type());
  BOOST_CHECK_EQUAL(amount_t("100.00"), atm.amount());
  BOOST_CHECK_EQUAL(amount_t("4300.00"), *atm.balance());
  BOOST_CHECK_EQUAL(date_t(2025, 1, 10), atm.date());

  const standardized_xact_t& transfer(result.accepted[1].xact);
  BOOST_CHECK_EQUAL(XACT_CREDIT, transfer.type());
  BOOST_CHECK_EQUAL(amount_t("1500.00"), transfer.amount());
  // Balances the statement leaves out are carried forward
  BOOST_CHECK_EQUAL(amount_t("5800.00"), *transfer.balance());

  // A fee line without a date takes the statement's closing date
  const standardized_xact_t& fee(result.accepted[2].xact);
  BOOST_CHECK_EQUAL(XACT_SERVICE_FEE, fee.type());
  BOOST_CHECK_EQUAL(amount_t("35.00"), fee.amount());
  BOOST_CHECK_EQUAL(date_t(2025, 1, 31), fee.date());
  BOOST_CHECK_EQUAL(amount_t("5765.00"), *fee.balance());

  BOOST_REQUIRE_EQUAL(3U, store.size());
  const bank_xact_t& row(store.transactions()[2]);
  BOOST_CHECK_EQUAL(result.accepted[2].id, row.id);
  BOOST_CHECK_EQUAL(1L, row.company_id);
  BOOST_CHECK_EQUAL(1L, row.period_id);
  BOOST_CHECK_EQUAL(amount_t("35.00"), row.debit);
  BOOST_CHECK(row.credit.is_zero());
}

BOOST_AUTO_TEST_CASE(testServiceFeeLine)
{
  session_t session(config, store);

  std::vector<string> lines;
  lines.push_back("SERVICE FEE 35.00-");

  config.statement_date = date_t(2025, 1, 31);
  import_result_t result(session.ingest(lines));

  BOOST_REQUIRE_EQUAL(1U, result.accepted.size());
  BOOST_CHECK_EQUAL(XACT_SERVICE_FEE, result.accepted[0].xact.type());
  BOOST_CHECK_EQUAL(amount_t("35.00"), result.accepted[0].xact.amount());
}

BOOST_AUTO_TEST_CASE(testReingestFindsDuplicates)
{
  session_t session(config, store);

  import_result_t first(session.ingest(statement));
  BOOST_CHECK_EQUAL(3U, first.accepted.size());

  import_result_t second(session.ingest(statement));
  BOOST_CHECK(second.accepted.empty());
  BOOST_REQUIRE_EQUAL(3U, second.duplicates.size());
  BOOST_CHECK_EQUAL(first.accepted[0].id, second.duplicates[0].existing_id);
  BOOST_CHECK_EQUAL(first.accepted[2].id, second.duplicates[2].existing_id);

  BOOST_CHECK_EQUAL(3U, store.size());
}

BOOST_AUTO_TEST_CASE(testDuplicateWithinStatement)
{
  session_t session(config, store);

  std::vector<string> lines;
  lines.push_back("2025-01-10 ATM WITHDRAWAL 100.00- 4300.00");
  lines.push_back("2025-01-10 ATM WITHDRAWAL 100.00- 4300.00");
  lines.push_back("2025-01-10 ATM WITHDRAWAL 100.00- 4200.00");

  import_result_t result(session.ingest(lines));

  BOOST_CHECK_EQUAL(2U, result.accepted.size());
  BOOST_REQUIRE_EQUAL(1U, result.duplicates.size());
  BOOST_CHECK_EQUAL(2U, result.duplicates[0].linenum);
  BOOST_CHECK_EQUAL(result.accepted[0].id, result.duplicates[0].existing_id);
}

BOOST_AUTO_TEST_CASE(testMissingDate)
{
  session_t session(config, store);

  std::vector<string> lines;
  lines.push_back("SERVICE FEE 35.00-");

  import_result_t result(session.ingest(lines));

  BOOST_CHECK(result.accepted.empty());
  BOOST_REQUIRE_EQUAL(1U, result.build_errors.size());
  BOOST_CHECK_EQUAL(string("date"), result.build_errors[0].field);
  BOOST_CHECK_EQUAL(1U, result.build_errors[0].linenum);
  BOOST_CHECK_EQUAL(0U, store.size());
}

BOOST_AUTO_TEST_CASE(testRowsWithoutAmount)
{
  session_t session(config, store);

  std::vector<string> lines;
  lines.push_back("Statement from 16/02/2024 to 15/03/2024");
  lines.push_back("IB PAYMENT TO ACME SUPPLIES 03 01 45,300.00");
  lines.push_back("2024-03-02 SUNDRY ITEM 0.00");
  lines.push_back("IB PAYMENT TO ACME SUPPLIES 1,200.00- 03 15 44,100.00");

  import_result_t result(session.ingest(lines));

  BOOST_CHECK(result.unparsed.empty());
  BOOST_REQUIRE_EQUAL(2U, result.build_errors.size());
  BOOST_CHECK_EQUAL(string("amount"), result.build_errors[0].field);
  BOOST_CHECK_EQUAL(2U, result.build_errors[0].linenum);
  BOOST_CHECK_EQUAL(string("amount"), result.build_errors[1].field);
  BOOST_CHECK_EQUAL(3U, result.build_errors[1].linenum);

  BOOST_REQUIRE_EQUAL(1U, result.accepted.size());
  const standardized_xact_t& payment(result.accepted[0].xact);
  BOOST_CHECK_EQUAL(XACT_DEBIT, payment.type());
  BOOST_CHECK_EQUAL(amount_t("1200.00"), payment.amount());
  BOOST_CHECK_EQUAL(string("IB PAYMENT TO ACME SUPPLIES"),
                    payment.description());
  BOOST_CHECK_EQUAL(1U, store.size());

  foreach (const accepted_xact_t& accepted, result.accepted)
    BOOST_CHECK(accepted.xact.amount().is_nonzero());
}

BOOST_AUTO_TEST_CASE(testContinuationLines)
{
  session_t session(config, store);

  std::vector<string> lines;
  lines.push_back("Statement from 16/02/2024 to 15/03/2024");
  lines.push_back("MAGTAPE CREDIT ABC LTD 1,000.00 02 20 6,000.00");
  lines.push_back("PAYMENT REF 12345678");
  lines.push_back("SERVICE FEES ## 02 28 5,950.00");

  import_result_t result(session.ingest(lines));

  BOOST_CHECK(result.unparsed.empty());
  BOOST_REQUIRE_EQUAL(2U, result.accepted.size());

  const standardized_xact_t& credit(result.accepted[0].xact);
  BOOST_CHECK_EQUAL(string("MAGTAPE CREDIT ABC LTD PAYMENT REF 12345678"),
                    credit.description());
  BOOST_CHECK_EQUAL(string("12345678"), *credit.reference());
  BOOST_CHECK_EQUAL(XACT_CREDIT, credit.type());
  BOOST_CHECK_EQUAL(amount_t("1000.00"), credit.amount());
  BOOST_CHECK_EQUAL(date_t(2024, 2, 20), credit.date());

  const standardized_xact_t& fee(result.accepted[1].xact);
  BOOST_CHECK_EQUAL(string("SERVICE FEES"), fee.description());
  BOOST_CHECK_EQUAL(XACT_SERVICE_FEE, fee.type());
  BOOST_CHECK_EQUAL(amount_t("50.00"), fee.amount());
  BOOST_CHECK_EQUAL(date_t(2024, 2, 28), fee.date());
}

BOOST_AUTO_TEST_CASE(testClassifyReport)
{
  session_t session(config, store);

  std::vector<line_report_t> reports(session.classify(statement));
  BOOST_REQUIRE_EQUAL(statement.size(), reports.size());

  BOOST_CHECK(reports[0].header);
  BOOST_CHECK_EQUAL(LINE_NOISE, reports[1].kind);
  BOOST_CHECK_EQUAL(string("debit-credit"), reports[3].parser);
  BOOST_CHECK_EQUAL(string("credit-transfer"), reports[4].parser);
  BOOST_CHECK_EQUAL(string("service-fee"), reports[5].parser);
  BOOST_CHECK_EQUAL(LINE_OTHER, reports[6].kind);
  BOOST_CHECK_EQUAL(LINE_TRANSACTION, reports[7].kind);
  BOOST_CHECK(! reports[7].error.empty());

  // Classifying stores nothing
  BOOST_CHECK_EQUAL(0U, store.size());

  std::ostringstream out;
  print_line_reports(out, reports);
  BOOST_CHECK(out.str().find("service-fee") != string::npos);
}

BOOST_AUTO_TEST_CASE(testReadLines)
{
  std::istringstream in("first line\r\nsecond line\n\nlast");
  std::vector<string> lines(read_lines(in));

  BOOST_REQUIRE_EQUAL(4U, lines.size());
  BOOST_CHECK_EQUAL(string("first line"), lines[0]);
  BOOST_CHECK_EQUAL(string("second line"), lines[1]);
  BOOST_CHECK(lines[2].empty());
  BOOST_CHECK_EQUAL(string("last"), lines[3]);
}

BOOST_AUTO_TEST_CASE(testImportReport)
{
  session_t       session(config, store);
  import_result_t result(session.ingest(statement, "january.txt"));

  std::ostringstream out;
  print_import_result(out, result);

  BOOST_CHECK(out.str().find("january.txt: 3 accepted") == 0);
  BOOST_CHECK(out.str().find("EFT REF 5566") != string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
