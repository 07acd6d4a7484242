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

#include "csv.h"

namespace reckon {

string csv_reader::read_field(std::istream& instr)
{
  string field;

  char c;
  if (instr.peek() == '"' || instr.peek() == '|') {
    instr.get(c);
    char x;
    while (instr.good() && ! instr.eof()) {
      instr.get(x);
      if (! instr.good())
        break;
      if (x == '\\') {
        instr.get(x);
      }
      else if (x == '"' && instr.peek() == '"') {
        instr.get(x);
      }
      else if (x == c) {
        if (x == '|')
          instr.unget();
        else if (instr.peek() == ',')
          instr.get(c);
        break;
      }
      if (x != '\0')
        field += x;
    }
  }
  else {
    while (instr.good() && ! instr.eof()) {
      instr.get(c);
      if (instr.good()) {
        if (c == ',')
          break;
        if (c != '\0')
          field += c;
      }
    }
  }
  trim(field);
  return field;
}

bool csv_reader::next_line()
{
  while (std::getline(in, linebuf)) {
    linenum++;
    if (! linebuf.empty() && linebuf[linebuf.length() - 1] == '\r')
      linebuf.erase(linebuf.length() - 1);
    if (trimmed(linebuf).empty() || linebuf[0] == '#')
      continue;
    return true;
  }
  return false;
}

void csv_reader::read_index()
{
  if (! next_line())
    return;

  std::istringstream instr(linebuf);

  while (instr.good() && ! instr.eof()) {
    string field = read_field(instr);
    names.push_back(field);

    string name(lowered(field));
    replace_all(name, "_", " ");
    name = collapse_ws(name);

    for (std::size_t i = 0; i < masks.size(); i++) {
      if (masks[i].first.match(name)) {
        index.push_back(masks[i].second);
        break;
      }
    }

    DEBUG("csv.parse", "Header field: " << field);
  }
}

bool csv_reader::read_record(record_t& record)
{
  record.clear();

  if (index.empty() || ! next_line())
    return false;

  std::istringstream instr(linebuf);

  std::vector<headers_t>::size_type n = 0;
  while (instr.good() && ! instr.eof() && n < index.size()) {
    string field = read_field(instr);
    if (index[n] != FIELD_UNKNOWN)
      record[index[n]] = field;
    n++;
  }
  return true;
}

void csv_reader::require(const headers_t field, const char * what) const
{
  if (! has_field(field))
    throw_(csv_error, _f("%1% has no %2% column") % pathname % what);
}

namespace {
  string field_of(const csv_reader::record_t& record,
                  const csv_reader::headers_t field)
  {
    csv_reader::record_t::const_iterator i = record.find(field);
    return i == record.end() ? empty_string : (*i).second;
  }

  long id_field(const csv_reader::record_t& record,
                const csv_reader::headers_t field, const char * what)
  {
    string text(field_of(record, field));
    try {
      return lexical_cast<long>(text);
    }
    catch (const bad_lexical_cast&) {
      throw_(csv_error, _f("Invalid %1% '%2%'") % what % text);
    }
    return 0;
  }

  date_t date_field(const csv_reader::record_t& record,
                    const csv_reader::headers_t field, const char * what)
  {
    string text(field_of(record, field));
    if (text.empty())
      throw_(csv_error, _f("Missing %1%") % what);
    return parse_date(text);
  }

  amount_t amount_field(const csv_reader::record_t& record,
                        const csv_reader::headers_t field)
  {
    string text(field_of(record, field));
    if (text.empty())
      return amount_t(0L);
    return amount_t(text);
  }

  optional<amount_t> optional_amount_field(const csv_reader::record_t& record,
                                           const csv_reader::headers_t field)
  {
    string text(field_of(record, field));
    if (text.empty())
      return none;
    return amount_t(text);
  }
}

void read_fiscal_periods(csv_reader& reader, memory_journal_store_t& journal)
{
  reader.require(csv_reader::FIELD_ID, "period id");
  reader.require(csv_reader::FIELD_COMPANY, "company");
  reader.require(csv_reader::FIELD_START, "start date");
  reader.require(csv_reader::FIELD_END, "end date");

  csv_reader::record_t record;
  while (reader.read_record(record)) {
    try {
      fiscal_period_t period;
      period.id         = id_field(record, csv_reader::FIELD_ID, "period id");
      period.company_id = id_field(record, csv_reader::FIELD_COMPANY,
                                   "company id");
      period.name       = field_of(record, csv_reader::FIELD_NAME);
      period.start      = date_field(record, csv_reader::FIELD_START,
                                     "start date");
      period.end        = date_field(record, csv_reader::FIELD_END,
                                     "end date");
      journal.add_period(period);
    }
    catch (const std::exception&) {
      add_error_context(_f("While reading fiscal period at %1%")
                        % reader.location());
      add_error_context(line_context(reader.get_last_line()));
      throw;
    }
  }
}

std::size_t read_journal(csv_reader& reader, memory_journal_store_t& journal)
{
  reader.require(csv_reader::FIELD_ENTRY, "journal entry");
  reader.require(csv_reader::FIELD_COMPANY, "company");
  reader.require(csv_reader::FIELD_PERIOD, "fiscal period");
  reader.require(csv_reader::FIELD_CODE, "account code");

  typedef std::map<string, journal_entry_t> entries_map;

  entries_map          entries;
  std::vector<string>  order;
  csv_reader::record_t record;

  while (reader.read_record(record)) {
    try {
      string key(field_of(record, csv_reader::FIELD_ENTRY));
      if (key.empty())
        throw_(csv_error, _("Missing journal entry"));

      entries_map::iterator i = entries.find(key);
      if (i == entries.end()) {
        journal_entry_t entry;
        entry.reference  = key;
        entry.company_id = id_field(record, csv_reader::FIELD_COMPANY,
                                    "company id");
        entry.period_id  = id_field(record, csv_reader::FIELD_PERIOD,
                                    "fiscal period id");
        if (! field_of(record, csv_reader::FIELD_DATE).empty())
          entry.date = date_field(record, csv_reader::FIELD_DATE, "date");
        entry.description = field_of(record, csv_reader::FIELD_DETAILS);

        i = entries.insert(entries_map::value_type(key, entry)).first;
        order.push_back(key);
      }

      string code(field_of(record, csv_reader::FIELD_CODE));
      if (code.empty())
        throw_(csv_error, _("Missing account code"));

      optional<account_type_t> type;
      string type_name(field_of(record, csv_reader::FIELD_TYPE));
      if (! type_name.empty()) {
        type = string_to_account_type(type_name);
        if (! type)
          throw_(csv_error, _f("Unknown account type '%1%'") % type_name);
      }

      (*i).second.lines.push_back
        (journal_line_t(code, field_of(record, csv_reader::FIELD_ACCOUNT),
                        amount_field(record, csv_reader::FIELD_DEBIT),
                        amount_field(record, csv_reader::FIELD_CREDIT),
                        type));
    }
    catch (const std::exception&) {
      add_error_context(_f("While reading journal line at %1%")
                        % reader.location());
      add_error_context(line_context(reader.get_last_line()));
      throw;
    }
  }

  foreach (const string& key, order)
    journal.post(entries[key]);

  INFO("Posted " << order.size() << " journal entries from "
       << reader.get_pathname());

  return order.size();
}

std::size_t read_history(csv_reader& reader, transaction_store_t& store)
{
  reader.require(csv_reader::FIELD_COMPANY, "company");
  reader.require(csv_reader::FIELD_DATE, "date");
  reader.require(csv_reader::FIELD_DETAILS, "details");

  std::size_t          count = 0;
  csv_reader::record_t record;

  while (reader.read_record(record)) {
    try {
      bank_xact_t row;
      if (! field_of(record, csv_reader::FIELD_ID).empty())
        row.id = id_field(record, csv_reader::FIELD_ID, "transaction id");
      row.company_id = id_field(record, csv_reader::FIELD_COMPANY,
                                "company id");
      if (! field_of(record, csv_reader::FIELD_PERIOD).empty())
        row.period_id = id_field(record, csv_reader::FIELD_PERIOD,
                                 "fiscal period id");
      row.date    = date_field(record, csv_reader::FIELD_DATE, "date");
      row.details = field_of(record, csv_reader::FIELD_DETAILS);
      row.debit   = amount_field(record, csv_reader::FIELD_DEBIT).abs();
      row.credit  = amount_field(record, csv_reader::FIELD_CREDIT).abs();
      row.balance = optional_amount_field(record, csv_reader::FIELD_BALANCE);
      row.created = CURRENT_TIME();

      store.insert(row);
      count++;
    }
    catch (const std::exception&) {
      add_error_context(_f("While reading transaction history at %1%")
                        % reader.location());
      add_error_context(line_context(reader.get_last_line()));
      throw;
    }
  }

  INFO("Loaded " << count << " previously imported transactions from "
       << reader.get_pathname());

  return count;
}

} // namespace reckon
