#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE balance
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "balance.h"

using namespace reckon;

namespace {
  // A journal which hands back whatever lines it was given, so that
  // figures the posting checks would refuse can still be examined.
  class fixed_journal_t : public journal_store_t
  {
  public:
    std::vector<journal_line_t> period_lines;
    std::vector<journal_line_t> prior_lines;

    virtual std::vector<journal_line_t>
    lines_for_period(const long, const long) const {
      return period_lines;
    }
    virtual std::vector<journal_line_t>
    lines_before_period(const long, const long) const {
      return prior_lines;
    }
  };

  fiscal_period_t make_period(long id, long company_id, const date_t& start,
                              const date_t& end)
  {
    fiscal_period_t period;
    period.id         = id;
    period.company_id = company_id;
    period.name       = "P" + lexical_cast<string>(id);
    period.start      = start;
    period.end        = end;
    return period;
  }

  journal_entry_t make_entry(long company_id, long period_id,
                             const string& reference)
  {
    journal_entry_t entry;
    entry.company_id = company_id;
    entry.period_id  = period_id;
    entry.reference  = reference;
    return entry;
  }
}

struct balance_fixture {
  config_t               config;
  memory_journal_store_t journal;

  balance_fixture() {
    times_initialize();
    journal.add_period(make_period(1, 1, date_t(2025, 1, 1),
                                   date_t(2025, 1, 31)));
    journal.add_period(make_period(2, 1, date_t(2025, 2, 1),
                                   date_t(2025, 2, 28)));
    journal.add_period(make_period(3, 2, date_t(2025, 1, 1),
                                   date_t(2025, 1, 31)));
  }

  ~balance_fixture() {
    times_shutdown();
  }

  const account_balance_t& account(const trial_balance_t& tb,
                                   const string& code) {
    foreach (const account_balance_t& balance, tb.accounts)
      if (balance.account_code == code)
        return balance;
    BOOST_FAIL("No account " << code << " in the trial balance");
    return tb.accounts.front();
  }
};

BOOST_FIXTURE_TEST_SUITE(balance, balance_fixture)

BOOST_AUTO_TEST_CASE(testBalancedPeriod)
{
  journal_entry_t e1(make_entry(1, 1, "E1"));
  e1.lines.push_back(journal_line_t("1100", "Bank", amount_t("443,053.92"),
                                    amount_t(0L)));
  e1.lines.push_back(journal_line_t("8100", "Purchases", amount_t(0L),
                                    amount_t("324,007.75")));
  e1.lines.push_back(journal_line_t("2100", "Loan", amount_t(0L),
                                    amount_t("100,000.00")));
  e1.lines.push_back(journal_line_t("3100", "Capital", amount_t(0L),
                                    amount_t("19,046.17")));
  journal.post(e1);

  journal_entry_t e2(make_entry(1, 1, "E2"));
  e2.lines.push_back(journal_line_t("8100", "Purchases",
                                    amount_t("534,905.00"), amount_t(0L)));
  e2.lines.push_back(journal_line_t("1100", "Bank", amount_t(0L),
                                    amount_t("512,103.68")));
  e2.lines.push_back(journal_line_t("3100", "Capital", amount_t(0L),
                                    amount_t("22,801.32")));
  journal.post(e2);

  trial_balance_t tb(compute_trial_balance(journal, config, 1, 1));

  BOOST_CHECK(tb.balanced);
  BOOST_CHECK_EQUAL(tb.total_debit, tb.total_credit);
  BOOST_CHECK_EQUAL(amount_t("210897.25"), tb.total_debit);
  BOOST_CHECK(tb.difference().is_zero());
  BOOST_CHECK_EQUAL(string("balanced"), string(tb.direction()));

  BOOST_REQUIRE_EQUAL(4U, tb.accounts.size());
  BOOST_CHECK_EQUAL(string("1100"), tb.accounts[0].account_code);
  BOOST_CHECK_EQUAL(string("2100"), tb.accounts[1].account_code);
  BOOST_CHECK_EQUAL(string("3100"), tb.accounts[2].account_code);
  BOOST_CHECK_EQUAL(string("8100"), tb.accounts[3].account_code);

  const account_balance_t& bank(account(tb, "1100"));
  BOOST_CHECK_EQUAL(NORMAL_DEBIT, bank.normal_balance);
  BOOST_CHECK_EQUAL(amount_t("443053.92"), bank.period_debits);
  BOOST_CHECK_EQUAL(amount_t("512103.68"), bank.period_credits);
  BOOST_CHECK_EQUAL(amount_t("-69049.76"), bank.closing_balance);
  BOOST_CHECK(bank.trial_balance_debit().is_zero());
  BOOST_CHECK_EQUAL(amount_t("69049.76"), bank.trial_balance_credit());

  const account_balance_t& purchases(account(tb, "8100"));
  BOOST_CHECK_EQUAL(ACCOUNT_EXPENSE, purchases.account_type);
  BOOST_CHECK_EQUAL(amount_t("210897.25"), purchases.closing_balance);
  BOOST_CHECK_EQUAL(amount_t("210897.25"), purchases.trial_balance_debit());

  const account_balance_t& loan(account(tb, "2100"));
  BOOST_CHECK_EQUAL(NORMAL_CREDIT, loan.normal_balance);
  BOOST_CHECK_EQUAL(amount_t("100000.00"), loan.trial_balance_credit());

  const account_balance_t& capital(account(tb, "3100"));
  BOOST_CHECK_EQUAL(amount_t("41847.49"), capital.trial_balance_credit());
}

BOOST_AUTO_TEST_CASE(testClosingIdentity)
{
  journal_entry_t e1(make_entry(1, 1, "E1"));
  e1.lines.push_back(journal_line_t("1100", "Bank", amount_t("1000.00"),
                                    amount_t(0L)));
  e1.lines.push_back(journal_line_t("4100", "Sales", amount_t(0L),
                                    amount_t("1000.00")));
  journal.post(e1);

  journal_entry_t e2(make_entry(1, 2, "E2"));
  e2.lines.push_back(journal_line_t("8100", "Rent", amount_t("200.00"),
                                    amount_t(0L)));
  e2.lines.push_back(journal_line_t("1100", "Bank", amount_t(0L),
                                    amount_t("200.00")));
  journal.post(e2);

  trial_balance_t tb(compute_trial_balance(journal, config, 1, 2));

  BOOST_CHECK(tb.balanced);
  BOOST_REQUIRE_EQUAL(3U, tb.accounts.size());

  foreach (const account_balance_t& balance, tb.accounts) {
    amount_t expected(balance.opening_balance);
    if (balance.normal_balance == NORMAL_DEBIT)
      expected += balance.period_debits - balance.period_credits;
    else
      expected += balance.period_credits - balance.period_debits;
    BOOST_CHECK_EQUAL(expected, balance.closing_balance);
  }

  const account_balance_t& bank(account(tb, "1100"));
  BOOST_CHECK_EQUAL(amount_t("1000.00"), bank.opening_balance);
  BOOST_CHECK_EQUAL(amount_t("800.00"), bank.closing_balance);

  const account_balance_t& sales(account(tb, "4100"));
  BOOST_CHECK_EQUAL(ACCOUNT_REVENUE, sales.account_type);
  BOOST_CHECK_EQUAL(amount_t("1000.00"), sales.opening_balance);
  BOOST_CHECK(sales.period_credits.is_zero());
  BOOST_CHECK_EQUAL(amount_t("1000.00"), sales.trial_balance_credit());

  BOOST_CHECK_EQUAL(amount_t("1000.00"), tb.total_debit);

  // The first period has no opening balances at all
  trial_balance_t first(compute_trial_balance(journal, config, 1, 1));
  foreach (const account_balance_t& balance, first.accounts)
    BOOST_CHECK(balance.opening_balance.is_zero());
}

BOOST_AUTO_TEST_CASE(testOtherCompaniesIgnored)
{
  journal_entry_t e1(make_entry(2, 3, "E1"));
  e1.lines.push_back(journal_line_t("1100", "Bank", amount_t("50.00"),
                                    amount_t(0L)));
  e1.lines.push_back(journal_line_t("4100", "Sales", amount_t(0L),
                                    amount_t("50.00")));
  journal.post(e1);

  trial_balance_t tb(compute_trial_balance(journal, config, 1, 1));
  BOOST_CHECK(tb.accounts.empty());
  BOOST_CHECK(tb.balanced);
  BOOST_CHECK(tb.total_debit.is_zero());
}

BOOST_AUTO_TEST_CASE(testUnbalanced)
{
  fixed_journal_t fixed;
  fixed.period_lines.push_back(journal_line_t("1100", "Bank",
                                              amount_t("100.00"),
                                              amount_t(0L)));
  fixed.period_lines.push_back(journal_line_t("4100", "Sales", amount_t(0L),
                                              amount_t("90.00")));

  trial_balance_t tb(compute_trial_balance(fixed, config, 1, 1));

  BOOST_CHECK(! tb.balanced);
  BOOST_CHECK_EQUAL(amount_t("10.00"), tb.difference());
  BOOST_CHECK_EQUAL(string("debits exceed credits"), string(tb.direction()));
}

BOOST_AUTO_TEST_CASE(testAccountTypes)
{
  fixed_journal_t fixed;
  fixed.period_lines.push_back(journal_line_t("9999", "Suspense",
                                              amount_t(0L),
                                              amount_t("10.00"),
                                              ACCOUNT_LIABILITY));
  fixed.period_lines.push_back(journal_line_t("1100", "Bank",
                                              amount_t("10.00"),
                                              amount_t(0L)));

  trial_balance_t tb(compute_trial_balance(fixed, config, 1, 1));
  BOOST_CHECK(tb.balanced);

  const account_balance_t& suspense(account(tb, "9999"));
  BOOST_CHECK_EQUAL(NORMAL_CREDIT, suspense.normal_balance);
  BOOST_CHECK_EQUAL(amount_t("10.00"), suspense.closing_balance);

  fixed.period_lines.push_back(journal_line_t("0100", "Mystery",
                                              amount_t("1.00"),
                                              amount_t(0L)));
  BOOST_CHECK_THROW(compute_trial_balance(fixed, config, 1, 1), config_error);
}

BOOST_AUTO_TEST_CASE(testPostingChecks)
{
  journal_entry_t unbalanced(make_entry(1, 1, "BAD"));
  unbalanced.lines.push_back(journal_line_t("1100", "Bank",
                                            amount_t("10.00"), amount_t(0L)));
  unbalanced.lines.push_back(journal_line_t("4100", "Sales", amount_t(0L),
                                            amount_t("9.99")));
  BOOST_CHECK_THROW(journal.post(unbalanced), balance_error);

  journal_entry_t empty(make_entry(1, 1, "EMPTY"));
  BOOST_CHECK_THROW(journal.post(empty), balance_error);

  journal_entry_t wrong_company(make_entry(2, 1, "WRONG"));
  wrong_company.lines.push_back(journal_line_t("1100", "Bank",
                                               amount_t("1.00"),
                                               amount_t(0L)));
  wrong_company.lines.push_back(journal_line_t("4100", "Sales", amount_t(0L),
                                               amount_t("1.00")));
  BOOST_CHECK_THROW(journal.post(wrong_company), store_error);

  journal_entry_t unknown(make_entry(1, 42, "UNKNOWN"));
  BOOST_CHECK_THROW(journal.post(unknown), store_error);

  BOOST_CHECK_EQUAL(0U, journal.size());

  BOOST_CHECK_THROW(compute_trial_balance(journal, config, 1, 42),
                    store_error);
  BOOST_CHECK_THROW(journal.add_period(make_period(1, 1, date_t(2025, 3, 1),
                                                   date_t(2025, 3, 31))),
                    store_error);
  BOOST_CHECK_THROW(journal.add_period(make_period(9, 1, date_t(2025, 3, 31),
                                                   date_t(2025, 3, 1))),
                    store_error);
}

BOOST_AUTO_TEST_SUITE_END()
