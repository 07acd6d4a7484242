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

#include "journal.h"

namespace reckon {

amount_t journal_entry_t::total_debit() const
{
  amount_t total(0L);
  foreach (const journal_line_t& line, lines)
    total += line.debit;
  return total;
}

amount_t journal_entry_t::total_credit() const
{
  amount_t total(0L);
  foreach (const journal_line_t& line, lines)
    total += line.credit;
  return total;
}

void memory_journal_store_t::add_period(const fiscal_period_t& period)
{
  if (period.id <= 0)
    throw_(store_error, _f("Fiscal period '%1%' has no id") % period.name);
  if (! is_valid(period.start) || ! is_valid(period.end) ||
      period.end < period.start)
    throw_(store_error, _f("Fiscal period %1% has an invalid date range")
           % period.id);
  if (periods.find(period.id) != periods.end())
    throw_(store_error, _f("Fiscal period %1% is defined twice") % period.id);

  periods.insert(periods_map::value_type(period.id, period));

  DEBUG("journal.periods", "Period " << period.id << " for company "
        << period.company_id << ": " << format_date(period.start)
        << " to " << format_date(period.end));
}

optional<fiscal_period_t>
memory_journal_store_t::find_period(const long period_id) const
{
  periods_map::const_iterator i = periods.find(period_id);
  if (i == periods.end())
    return none;
  return (*i).second;
}

const fiscal_period_t&
memory_journal_store_t::period_of(const long company_id,
                                  const long period_id) const
{
  periods_map::const_iterator i = periods.find(period_id);
  if (i == periods.end())
    throw_(store_error, _f("Unknown fiscal period %1%") % period_id);
  if ((*i).second.company_id != company_id)
    throw_(store_error, _f("Fiscal period %1% does not belong to company %2%")
           % period_id % company_id);
  return (*i).second;
}

long memory_journal_store_t::post(const journal_entry_t& entry)
{
  period_of(entry.company_id, entry.period_id);

  if (entry.lines.empty())
    throw_(balance_error, _f("Journal entry '%1%' has no lines")
           % entry.reference);

  foreach (const journal_line_t& line, entry.lines) {
    if (line.debit.sign() < 0 || line.credit.sign() < 0)
      throw_(balance_error,
             _f("Journal entry '%1%' has a negative amount on account %2%")
             % entry.reference % line.account_code);
  }

  if (! entry.balanced())
    throw_(balance_error,
           _f("Journal entry '%1%' does not balance: debits %2%, credits %3%")
           % entry.reference % entry.total_debit() % entry.total_credit());

  journal_entry_t posted(entry);
  if (posted.id == 0)
    posted.id = next_id;
  if (posted.id >= next_id)
    next_id = posted.id + 1;

  entries.push_back(posted);

  DEBUG("journal.post", "Posted entry " << posted.id << " ("
        << posted.reference << ") with " << posted.lines.size() << " lines");

  return posted.id;
}

std::vector<journal_line_t>
memory_journal_store_t::lines_for_period(const long company_id,
                                         const long period_id) const
{
  period_of(company_id, period_id);

  std::vector<journal_line_t> result;
  foreach (const journal_entry_t& entry, entries) {
    if (entry.company_id == company_id && entry.period_id == period_id)
      result.insert(result.end(), entry.lines.begin(), entry.lines.end());
  }
  return result;
}

std::vector<journal_line_t>
memory_journal_store_t::lines_before_period(const long company_id,
                                            const long period_id) const
{
  const fiscal_period_t& target(period_of(company_id, period_id));

  std::set<long> earlier;
  foreach (const periods_map::value_type& pair, periods) {
    if (pair.second.company_id == company_id &&
        pair.second.end < target.start)
      earlier.insert(pair.first);
  }

  std::vector<journal_line_t> result;
  foreach (const journal_entry_t& entry, entries) {
    if (entry.company_id == company_id &&
        earlier.find(entry.period_id) != earlier.end())
      result.insert(result.end(), entry.lines.begin(), entry.lines.end());
  }
  return result;
}

} // namespace reckon
