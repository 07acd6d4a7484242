#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE csv
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "csv.h"
#include "balance.h"
#include "session.h"

using namespace reckon;

struct csv_fixture {
  config_t config;

  csv_fixture() {
    times_initialize();
  }
  ~csv_fixture() {
    error_context();
    times_shutdown();
  }
};

BOOST_FIXTURE_TEST_SUITE(csv, csv_fixture)

BOOST_AUTO_TEST_CASE(testHeaderIndex)
{
  std::istringstream in("Transaction_ID, Company, Date ,Details,Debit,Credit,Balance,Memo\n"
                        "7,1,2025-01-10,\"ATM WITHDRAWAL, MAIN ST\",100.00,,\"4,300.00\",x\n");
  csv_reader reader(in, "history.csv");

  BOOST_CHECK(reader.has_field(csv_reader::FIELD_ID));
  BOOST_CHECK(reader.has_field(csv_reader::FIELD_COMPANY));
  BOOST_CHECK(reader.has_field(csv_reader::FIELD_DATE));
  BOOST_CHECK(reader.has_field(csv_reader::FIELD_DETAILS));
  BOOST_CHECK(reader.has_field(csv_reader::FIELD_BALANCE));
  BOOST_CHECK(! reader.has_field(csv_reader::FIELD_PERIOD));
  BOOST_CHECK_THROW(reader.require(csv_reader::FIELD_PERIOD, "period"),
                    csv_error);

  csv_reader::record_t record;
  BOOST_REQUIRE(reader.read_record(record));
  BOOST_CHECK_EQUAL(string("7"), record[csv_reader::FIELD_ID]);
  BOOST_CHECK_EQUAL(string("ATM WITHDRAWAL, MAIN ST"),
                    record[csv_reader::FIELD_DETAILS]);
  BOOST_CHECK_EQUAL(string(""), record[csv_reader::FIELD_CREDIT]);
  BOOST_CHECK_EQUAL(string("4,300.00"), record[csv_reader::FIELD_BALANCE]);
  BOOST_CHECK_EQUAL(2U, reader.get_linenum());

  BOOST_CHECK(! reader.read_record(record));
}

BOOST_AUTO_TEST_CASE(testTrialBalanceFromCsv)
{
  std::istringstream periods("id,company,name,start,end\n"
                             "# first quarter\n"
                             "1,1,Q1 2025,2025-01-01,2025-03-31\n"
                             "2,1,Q2 2025,2025-04-01,2025-06-30\n");
  std::istringstream entries
    ("entry,company,period,date,description,account_code,account_name,account_type,debit,credit\n"
     "E1,1,1,2025-01-05,Capital,1100,Bank,,\"1,000.00\",\n"
     "E2,1,2,2025-04-05,Rent,8100,Rent,expense,250.00,\n"
     "E1,1,1,2025-01-05,Capital,3100,Capital,equity,,\"1,000.00\"\n"
     "E2,1,2,2025-04-05,Rent,1100,Bank,,,250.00\n");

  memory_journal_store_t journal;

  csv_reader period_reader(periods, "periods.csv");
  read_fiscal_periods(period_reader, journal);
  BOOST_CHECK(journal.find_period(1));
  BOOST_CHECK_EQUAL(string("Q2 2025"), journal.find_period(2)->name);

  csv_reader entry_reader(entries, "journal.csv");
  BOOST_CHECK_EQUAL(2U, read_journal(entry_reader, journal));
  BOOST_CHECK_EQUAL(2U, journal.size());

  trial_balance_t tb(compute_trial_balance(journal, config, 1, 2));
  BOOST_CHECK(tb.balanced);
  BOOST_CHECK_EQUAL(amount_t("1000.00"), tb.total_debit);
  BOOST_REQUIRE_EQUAL(3U, tb.accounts.size());
  BOOST_CHECK_EQUAL(amount_t("1000.00"), tb.accounts[0].opening_balance);
  BOOST_CHECK_EQUAL(amount_t("750.00"), tb.accounts[0].closing_balance);
}

BOOST_AUTO_TEST_CASE(testUnbalancedCsvEntry)
{
  std::istringstream periods("id,company,start,end\n"
                             "1,1,2025-01-01,2025-03-31\n");
  std::istringstream entries
    ("entry,company,period,account_code,debit,credit\n"
     "E1,1,1,1100,100.00,\n"
     "E1,1,1,3100,,99.00\n");

  memory_journal_store_t journal;

  csv_reader period_reader(periods);
  read_fiscal_periods(period_reader, journal);

  csv_reader entry_reader(entries, "journal.csv");
  BOOST_CHECK_THROW(read_journal(entry_reader, journal), balance_error);
  BOOST_CHECK_EQUAL(0U, journal.size());
}

BOOST_AUTO_TEST_CASE(testBadRows)
{
  std::istringstream periods("id,company,start\n"
                             "1,1,2025-01-01\n");
  csv_reader no_end(periods, "periods.csv");
  memory_journal_store_t journal;
  BOOST_CHECK_THROW(read_fiscal_periods(no_end, journal), csv_error);

  std::istringstream bad_id("id,company,start,end\n"
                            "one,1,2025-01-01,2025-03-31\n");
  csv_reader bad_reader(bad_id, "periods.csv");
  BOOST_CHECK_THROW(read_fiscal_periods(bad_reader, journal), csv_error);
  BOOST_CHECK(error_context().find("periods.csv") != string::npos);

  std::istringstream bad_type("entry,company,period,account_code,account_type,debit,credit\n"
                              "E1,1,1,1100,goodwill,1.00,\n");
  csv_reader type_reader(bad_type, "journal.csv");
  BOOST_CHECK_THROW(read_journal(type_reader, journal), csv_error);
}

BOOST_AUTO_TEST_CASE(testHistorySeedsDuplicates)
{
  std::istringstream history
    ("id,company,period,date,details,debit,credit,balance\n"
     "7,1,1,2025-01-10,ATM WITHDRAWAL,100.00,,4300.00\n");

  memory_transaction_store_t store(config);
  csv_reader                 reader(history, "history.csv");
  BOOST_CHECK_EQUAL(1U, read_history(reader, store));
  BOOST_REQUIRE_EQUAL(1U, store.size());
  BOOST_CHECK_EQUAL(7L, store.transactions()[0].id);

  config.company_id = 1;
  config.period_id  = 1;

  session_t session(config, store);

  std::vector<string> lines;
  lines.push_back("2025-01-10 ATM WITHDRAWAL 100.00- 4300.00");
  lines.push_back("2025-01-11 ATM WITHDRAWAL 100.00- 4200.00");

  import_result_t result(session.ingest(lines));
  BOOST_REQUIRE_EQUAL(1U, result.duplicates.size());
  BOOST_CHECK_EQUAL(7L, result.duplicates[0].existing_id);
  BOOST_REQUIRE_EQUAL(1U, result.accepted.size());
  BOOST_CHECK_EQUAL(8L, result.accepted[0].id);
}

BOOST_AUTO_TEST_SUITE_END()
