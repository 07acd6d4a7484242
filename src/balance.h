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

/**
 * @addtogroup report
 */

/**
 * @file   balance.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief Per-account balances and the trial balance built from them.
 *
 * The trial balance is computed from posted journal lines only.  Bank
 * transactions record one side of each double entry, so a report built
 * from them could never balance.
 */
#pragma once

#include "journal.h"

namespace reckon {

/**
 * @class account_balance_t
 *
 * @brief Opening, movement and closing figures for one account.
 *
 * All four figures start at zero.  Balances are signed relative to the
 * account's normal side: a debit-normal account with more credits than
 * debits has a negative balance.
 */
class account_balance_t
{
public:
  string         account_code;
  string         account_name;
  account_type_t account_type;
  normal_side_t  normal_balance;

  amount_t opening_balance;
  amount_t period_debits;
  amount_t period_credits;
  amount_t closing_balance;

  account_balance_t(const string& code, const string& name,
                    const account_type_t type)
    : account_code(code), account_name(name), account_type(type),
      normal_balance(normal_side(type)),
      opening_balance(0L), period_debits(0L), period_credits(0L),
      closing_balance(0L) {}

  /**
   * The net effect of `debit' and `credit' on this account, signed
   * relative to its normal side.
   */
  amount_t movement(const amount_t& debit, const amount_t& credit) const {
    if (normal_balance == NORMAL_DEBIT)
      return debit - credit;
    else
      return credit - debit;
  }

  void compute_closing() {
    closing_balance = opening_balance +
                      movement(period_debits, period_credits);
  }

  bool has_activity() const {
    return (opening_balance.is_nonzero() || period_debits.is_nonzero() ||
            period_credits.is_nonzero());
  }

  /**
   * The closing balance as it appears in the trial balance's debit
   * column.  A debit-normal account shows a non-negative balance here;
   * a credit-normal account shows the magnitude of a negative one.
   */
  amount_t trial_balance_debit() const;
  amount_t trial_balance_credit() const;
};

struct trial_balance_t
{
  typedef std::vector<account_balance_t> accounts_list;

  long          company_id;
  long          period_id;
  accounts_list accounts;
  amount_t      total_debit;
  amount_t      total_credit;
  bool          balanced;

  trial_balance_t()
    : company_id(0), period_id(0), total_debit(0L), total_credit(0L),
      balanced(true) {}

  /**
   * total_debit - total_credit; zero when balanced.
   */
  amount_t difference() const {
    return total_debit - total_credit;
  }

  const char * direction() const;
};

/**
 * Build the trial balance of one company's fiscal period.  Accounts are
 * ordered by code, and accounts with neither an opening balance nor any
 * movement are left out.  An imbalance is reported in the result and
 * logged, never thrown.
 */
trial_balance_t compute_trial_balance(const journal_store_t& journal,
                                      const config_t&        config,
                                      const long             company_id,
                                      const long             period_id);

} // namespace reckon
