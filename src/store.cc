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

#include "store.h"
#include "config.h"

namespace reckon {

xact_key_t xact_key_t::of(const bank_xact_t& xact)
{
  xact_key_t key;
  key.company_id  = xact.company_id;
  key.date        = xact.date;
  key.debit       = xact.debit.is_null() ? amount_t(0L) : xact.debit;
  key.credit      = xact.credit.is_null() ? amount_t(0L) : xact.credit;
  key.description = xact.details;
  key.balance     = xact.balance;
  return key;
}

std::ostream& operator<<(std::ostream& out, const xact_key_t& key)
{
  out << "company " << key.company_id << ", "
      << format_date(key.date, FMT_WRITTEN) << ", debit " << key.debit
      << ", credit " << key.credit << ", \"" << key.description
      << "\", balance ";
  if (key.balance)
    out << *key.balance;
  else
    out << "(none)";
  return out;
}

bool memory_transaction_store_t::matches(const bank_xact_t& row,
                                         const xact_key_t&  key) const
{
  if (row.company_id != key.company_id || row.date != key.date)
    return false;

  // Null amounts are zero, and compare as such
  if (row.debit != key.debit || row.credit != key.credit)
    return false;

  if (static_cast<bool>(row.balance) != static_cast<bool>(key.balance))
    return false;
  if (row.balance && *row.balance != *key.balance)
    return false;

  return (config.normalize_description(row.details) ==
          config.normalize_description(key.description));
}

optional<bank_xact_t>
memory_transaction_store_t::find(const xact_key_t& key) const
{
  std::pair<index_map::const_iterator, index_map::const_iterator> range =
    index.equal_range(std::make_pair(key.company_id, key.date));

  for (index_map::const_iterator i = range.first; i != range.second; ++i) {
    const bank_xact_t& row(rows[(*i).second]);
    if (matches(row, key))
      return row;
  }
  return none;
}

long memory_transaction_store_t::insert(const bank_xact_t& xact)
{
  if (! is_valid(xact.date))
    throw_(store_error, _f("Cannot store a transaction without a date: %1%")
           % xact.details);
  if (xact.company_id <= 0)
    throw_(store_error, _f("Cannot store a transaction without a company: %1%")
           % xact.details);

  bank_xact_t row(xact);
  if (row.id == 0)
    row.id = next_id;
  if (row.id >= next_id)
    next_id = row.id + 1;

  rows.push_back(row);
  index.insert(index_map::value_type(std::make_pair(row.company_id, row.date),
                                     rows.size() - 1));

  DEBUG("store.insert", "Stored transaction " << row.id << ": "
        << xact_key_t::of(row));

  return row.id;
}

} // namespace reckon
