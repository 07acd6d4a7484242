/*
 * Copyright (c) 2003-2023, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <system.hh>

#include "balance.h"

namespace reckon {

amount_t account_balance_t::trial_balance_debit() const
{
  if (normal_balance == NORMAL_DEBIT)
    return closing_balance.sign() >= 0 ? closing_balance : amount_t(0L);
  else
    return closing_balance.sign() < 0 ? closing_balance.abs() : amount_t(0L);
}

amount_t account_balance_t::trial_balance_credit() const
{
  if (normal_balance == NORMAL_CREDIT)
    return closing_balance.sign() >= 0 ? closing_balance : amount_t(0L);
  else
    return closing_balance.sign() < 0 ? closing_balance.abs() : amount_t(0L);
}

const char * trial_balance_t::direction() const
{
  int sign = difference().sign();
  if (sign > 0)
    return _("debits exceed credits");
  else if (sign < 0)
    return _("credits exceed debits");
  else
    return _("balanced");
}

namespace {
  typedef std::map<string, account_balance_t> balances_map;

  account_balance_t& balance_for(balances_map&         balances,
                                 const journal_line_t& line,
                                 const config_t&       config)
  {
    balances_map::iterator i = balances.find(line.account_code);
    if (i == balances.end()) {
      account_type_t type = config.account_type(line.account_code,
                                                line.account_type);
      i = balances.insert
        (balances_map::value_type(line.account_code,
                                  account_balance_t(line.account_code,
                                                    line.account_name,
                                                    type))).first;
      DEBUG("trial.balance", "Account " << line.account_code << " ("
            << account_type_name(type) << ", normal side "
            << char((*i).second.normal_balance) << ")");
    }
    else if ((*i).second.account_name.empty()) {
      (*i).second.account_name = line.account_name;
    }
    return (*i).second;
  }
}

trial_balance_t compute_trial_balance(const journal_store_t& journal,
                                      const config_t&        config,
                                      const long             company_id,
                                      const long             period_id)
{
  INFO_START(trial_balance, "Trial balance for company " << company_id
             << ", period " << period_id);

  balances_map balances;

  foreach (const journal_line_t& line,
           journal.lines_before_period(company_id, period_id)) {
    account_balance_t& balance(balance_for(balances, line, config));
    balance.opening_balance += balance.movement(line.debit, line.credit);
  }

  foreach (const journal_line_t& line,
           journal.lines_for_period(company_id, period_id)) {
    account_balance_t& balance(balance_for(balances, line, config));
    balance.period_debits  += line.debit;
    balance.period_credits += line.credit;
  }

  trial_balance_t result;
  result.company_id = company_id;
  result.period_id  = period_id;

  foreach (balances_map::value_type& pair, balances) {
    account_balance_t& balance(pair.second);
    if (! balance.has_activity())
      continue;

    balance.compute_closing();

    result.total_debit  += balance.trial_balance_debit();
    result.total_credit += balance.trial_balance_credit();
    result.accounts.push_back(balance);

    DEBUG("trial.balance", balance.account_code << ": opening "
          << balance.opening_balance << " dr " << balance.period_debits
          << " cr " << balance.period_credits << " closing "
          << balance.closing_balance);
  }

  result.balanced = result.total_debit == result.total_credit;

  if (! result.balanced)
    WARN("Trial balance for company " << company_id << ", period "
         << period_id << " is out by " << result.difference().abs()
         << ": " << result.direction());

  INFO_FINISH(trial_balance);

  return result;
}

} // namespace reckon
