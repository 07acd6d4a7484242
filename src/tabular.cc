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

#include "tabular.h"
#include "config.h"
#include "mask.h"

namespace reckon {

const std::size_t tabular_parser_t::DETAILS_END;
const std::size_t tabular_parser_t::SERVICE_FEE_END;
const std::size_t tabular_parser_t::DEBITS_END;
const std::size_t tabular_parser_t::CREDITS_END;
const std::size_t tabular_parser_t::DATE_END;
const std::size_t tabular_parser_t::BALANCE_END;

namespace {
  // DETAILS [AMOUNT[-]] MM DD BALANCE[-].  No word of the details may
  // itself be a figure, or the amount would be read as description.
  const mask_t compact_mask
    ("^([A-Z]\\S*(?:\\s+(?![0-9,]+\\.[0-9]{2}-?\\s)\\S+)*?)\\s+"
     "(?:([0-9,]+\\.[0-9]{2}-?)\\s+)?"
     "([0-9]{2})\\s+([0-9]{2})\\s+([0-9,]+\\.[0-9]{2}-?)$", false);

  const mask_t continuation_mask
    ("^[A-Z0-9*][A-Z0-9\\s*\\-().:/#+]+$", false);

  const mask_t month_day_mask("^([0-9]{1,2})\\s+([0-9]{1,2})$");

  const mask_t amount_token_mask("[0-9]\\.[0-9]{2}\\b");

  const mask_t address_mask
    ("\\b(?:P\\.?O\\.? BOX|PRIVATE BAG|VAT REG|ACCOUNT NUMBER|BRANCH CODE"
     "|STATEMENT NO)\\b");

  string column(const string& line, std::size_t begin, std::size_t end)
  {
    if (begin >= line.length())
      return empty_string;
    return trimmed(line.substr(begin, end - begin));
  }

  // The balance before this row.  The row waiting in `pending' has not
  // been built yet, so its balance is newer than `last_balance'.
  optional<amount_t> previous_balance(const parse_context_t& context)
  {
    if (context.pending && context.pending->balance)
      return context.pending->balance;
    return context.last_balance;
  }

  bool is_fee_marker(const string& field)
  {
    return trimmed(field) == "##";
  }

  // Place the service-fee column.  A bare "##" marks the row's debit as
  // the fee; an amount is the fee itself.
  void apply_fee_column(raw_fields_t& fields, const string& fee)
  {
    if (is_fee_marker(fee)) {
      if (fields.debit) {
        fields.service_fee = fields.debit;
        fields.debit       = none;
      }
    } else {
      fields.service_fee = parse_amount_column(fee, "service fee");
    }
  }
}

optional<date_t>
tabular_parser_t::parse_date_column(const string&          text,
                                    const parse_context_t& context) const
{
  string field(trimmed(text));
  if (field.empty())
    return none;

  boost::smatch what;
  try {
    if (month_day_mask.match_all(field, what))
      return context.resolve_month_day(lexical_cast<int>(string(what[1])),
                                       lexical_cast<int>(string(what[2])));
  }
  catch (const date_error& err) {
    DEBUG("parse.tabular", "Unusable date column: " << err.what());
    return none;
  }
  return try_parse_date(field);
}

optional<tabular_parser_t::shape_t>
tabular_parser_t::shape_of(const string&          line,
                           const parse_context_t& context) const
{
  if (line.find('\t') != string::npos) {
    std::vector<string> fields;
    split(fields, line, is_any_of("\t"));
    if ((fields.size() == 5 || fields.size() == 6) &&
        ! trimmed(fields[0]).empty() &&
        parse_date_column(fields[fields.size() - 2], context))
      return SHAPE_TABBED;
  }

  if (line.length() > CREDITS_END &&
      ! column(line, 0, DETAILS_END).empty() &&
      parse_date_column(column(line, CREDITS_END, DATE_END), context))
    return SHAPE_FIXED;

  string text(trimmed(line));

  if (compact_mask.match_all(text))
    return SHAPE_COMPACT;

  if (context.last_was_tabular && context.pending &&
      continuation_mask.match_all(text) &&
      ! amount_token_mask.match(text) &&
      ! address_mask.match(text))
    return SHAPE_CONTINUATION;

  return none;
}

optional<raw_fields_t>
tabular_parser_t::parse(const string& line, parse_context_t& context) const
{
  optional<shape_t> shape = shape_of(line, context);
  if (! shape)
    throw_(parse_error, _f("Not a statement row: %1%") % line);

  raw_fields_t fields;

  switch (*shape) {
  case SHAPE_TABBED:
    fields = parse_tabbed(line, context);
    break;
  case SHAPE_FIXED:
    fields = parse_fixed(line, context);
    break;
  case SHAPE_COMPACT:
    fields = parse_compact(line, context);
    break;
  case SHAPE_CONTINUATION:
    append_continuation(line, context);
    return none;
  }

  fields.reference = extract_reference(fields.description);
  fields.linenum   = context.linenum;
  fields.parser    = name();

  DEBUG("parse.tabular",
        "Row at line " << fields.linenum << ": \"" << fields.description
        << "\" debit " << value_or_zero(fields.debit)
        << " credit " << value_or_zero(fields.credit)
        << " fee " << value_or_zero(fields.service_fee));

  return fields;
}

raw_fields_t tabular_parser_t::parse_tabbed(const string&    line,
                                            parse_context_t& context) const
{
  std::vector<string> columns;
  split(columns, line, is_any_of("\t"));

  raw_fields_t fields;
  std::size_t  n = 0;

  fields.description = collapse_ws(columns[n++]);

  string fee;
  if (columns.size() == 6)
    fee = columns[n++];

  fields.debit   = parse_amount_column(columns[n++], "debits");
  fields.credit  = parse_amount_column(columns[n++], "credits");
  fields.date    = parse_date_column(columns[n++], context);
  fields.balance = parse_amount_column(columns[n++], "balance");

  apply_fee_column(fields, fee);
  return fields;
}

raw_fields_t tabular_parser_t::parse_fixed(const string&    line,
                                           parse_context_t& context) const
{
  raw_fields_t fields;

  fields.description = collapse_ws(column(line, 0, DETAILS_END));
  fields.debit       = parse_amount_column(column(line, SERVICE_FEE_END,
                                                  DEBITS_END), "debits");
  fields.credit      = parse_amount_column(column(line, DEBITS_END,
                                                  CREDITS_END), "credits");
  fields.date        = parse_date_column(column(line, CREDITS_END, DATE_END),
                                         context);
  fields.balance     = parse_amount_column(column(line, DATE_END,
                                                  string::npos), "balance");

  apply_fee_column(fields, column(line, DETAILS_END, SERVICE_FEE_END));
  return fields;
}

raw_fields_t tabular_parser_t::parse_compact(const string&    line,
                                             parse_context_t& context) const
{
  boost::smatch what;
  string        text(trimmed(line));
  if (! compact_mask.match_all(text, what))
    throw_(parse_error, _f("Not a compact statement row: %1%") % line);

  raw_fields_t fields;

  string details(what[1]);
  bool   is_fee = details.find("##") != string::npos;
  if (is_fee)
    erase_all(details, "##");
  fields.description = collapse_ws(details);

  fields.date    = context.resolve_month_day(lexical_cast<int>(string(what[3])),
                                             lexical_cast<int>(string(what[4])));
  fields.balance = parse_amount_column(what[5], "balance");

  if (what[2].matched) {
    string   figure(what[2]);
    amount_t amt(parse_amount_column(figure, "amount")->abs());
    if (is_fee)
      fields.service_fee = amt;
    else if (ends_with(figure, "-"))
      fields.debit = amt;
    else
      fields.credit = amt;
  }
  else if (optional<amount_t> previous = previous_balance(context)) {
    // Only the balance was printed; the movement is its change.
    amount_t change(*fields.balance - *previous);
    if (change.sign() < 0) {
      if (is_fee)
        fields.service_fee = change.abs();
      else
        fields.debit = change.abs();
    } else {
      fields.credit = change;
    }
  }
  return fields;
}

void tabular_parser_t::append_continuation(const string&    line,
                                           parse_context_t& context) const
{
  string text(collapse_ws(line));

  context.pending->description += ' ';
  context.pending->description += text;
  if (! context.pending->reference)
    context.pending->reference = extract_reference(text);

  DEBUG("parse.tabular", "Continuation of line " << context.pending->linenum
        << ": " << text);
}

} // namespace reckon
