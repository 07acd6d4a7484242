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
 * @addtogroup data
 */

/**
 * @file   journal.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Posted journal entries, fiscal periods, and the store holding them.
 */
#pragma once

#include "amount.h"
#include "times.h"
#include "config.h"
#include "store.h"

namespace reckon {

DECLARE_EXCEPTION(balance_error, std::runtime_error);

struct fiscal_period_t
{
  long   id;
  long   company_id;
  string name;
  date_t start;
  date_t end;

  fiscal_period_t() : id(0), company_id(0) {}

  bool contains(const date_t& when) const {
    return start <= when && when <= end;
  }
};

/**
 * One debit or credit line of a journal entry, joined to the chart of
 * accounts.  The account type is only present when the chart gives one
 * explicitly; otherwise it is implied by the account code.
 */
struct journal_line_t
{
  string                   account_code;
  string                   account_name;
  optional<account_type_t> account_type;
  amount_t                 debit;
  amount_t                 credit;

  journal_line_t() : debit(0L), credit(0L) {}
  journal_line_t(const string& code, const string& name,
                 const amount_t& dr, const amount_t& cr,
                 const optional<account_type_t>& type = none)
    : account_code(code), account_name(name), account_type(type),
      debit(dr), credit(cr) {}
};

struct journal_entry_t
{
  typedef std::vector<journal_line_t> lines_list;

  long       id;
  long       company_id;
  long       period_id;
  date_t     date;
  string     reference;
  string     description;
  lines_list lines;

  journal_entry_t() : id(0), company_id(0), period_id(0) {}

  amount_t total_debit() const;
  amount_t total_credit() const;

  bool balanced() const {
    return total_debit() == total_credit();
  }
};

class journal_store_t
{
public:
  virtual ~journal_store_t() {}

  /**
   * Every posted line of the given period.
   */
  virtual std::vector<journal_line_t>
  lines_for_period(const long company_id, const long period_id) const = 0;

  /**
   * Every posted line of the company's periods which end before the
   * given period begins.  These make up the opening balances.
   */
  virtual std::vector<journal_line_t>
  lines_before_period(const long company_id, const long period_id) const = 0;
};

/**
 * @class memory_journal_store_t
 *
 * @brief Fiscal periods and journal entries held in memory.
 *
 * Entries are checked when posted: the period must exist and belong to
 * the entry's company (store_error), and debits must equal credits
 * (balance_error).
 */
class memory_journal_store_t : public journal_store_t
{
  typedef std::map<long, fiscal_period_t> periods_map;

  periods_map                  periods;
  std::vector<journal_entry_t> entries;
  long                         next_id;

public:
  memory_journal_store_t() : next_id(1) {}

  void add_period(const fiscal_period_t& period);

  optional<fiscal_period_t> find_period(const long period_id) const;

  long post(const journal_entry_t& entry);

  virtual std::vector<journal_line_t>
  lines_for_period(const long company_id, const long period_id) const;

  virtual std::vector<journal_line_t>
  lines_before_period(const long company_id, const long period_id) const;

  std::size_t size() const {
    return entries.size();
  }

protected:
  const fiscal_period_t& period_of(const long company_id,
                                   const long period_id) const;
};

} // namespace reckon
