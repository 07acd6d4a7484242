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

#include "lineparse.h"
#include "mask.h"

namespace reckon {

namespace {
  const mask_t leading_date_mask
    ("^((?:[0-9]{1,2}[/.-][0-9]{1,2}[/.-][0-9]{2,4}"
     "|[0-9]{4}[/-][0-9]{2}[/-][0-9]{2}"
     "|[0-9]{1,2}[ -][a-z]{3,9}\\.?[ -][0-9]{2,4}))\\s+(.*)$");

  const mask_t credit_line_mask
    ("^(.*?\\S)\\s+R?\\s?([0-9,]+\\.[0-9]{2})\\s*(?:CR)?$");
  const mask_t credit_words_mask
    ("\\b(?:credit|deposit|transfer from|payment from|received from"
     "|salary|refund|interest|dividend)\\b");
  const mask_t fee_words_mask("fee|charge|##");

  const mask_t fee_line_mask
    ("^(.*?)\\s*(?:##\\s*)?([0-9,]+\\.[0-9]{2})-?\\s*(?:##)?"
     "(?:\\s+([0-9,]+\\.[0-9]{2}-?))?\\s*$");
  const mask_t fee_amount_end_mask
    ("(?:[0-9]+\\.[0-9]{2}-?\\s*(?:##)?|##\\s*[0-9,]+\\.[0-9]{2}-?)\\s*$");
  const mask_t table_header_mask
    ("(?:Fee|Debits|Credits|Date|Balance).*(?:Fee|Debits|Credits|Date|Balance)",
     false);

  const mask_t debit_credit_mask
    ("^(.*?\\S)\\s+R?\\s?([0-9,]+\\.[0-9]{2})\\s*(-|CR|DR)?"
     "(?:\\s+R?\\s?([0-9,]+\\.[0-9]{2})\\s*(-|CR|DR)?)?\\s*$");

  const mask_t amount_token_mask("[0-9]\\.[0-9]{2}\\b");
  const mask_t letter_mask("[a-z]");

  // Split off a leading date, if the line has one.
  string strip_leading_date(const string& line, optional<string>& date_text)
  {
    string        text(trimmed(line));
    boost::smatch what;
    if (leading_date_mask.match_all(text, what)) {
      date_text = string(what[1]);
      return string(what[2]);
    }
    date_text = none;
    return text;
  }

  optional<date_t> line_date(const optional<string>& date_text,
                             const parse_context_t&  context)
  {
    if (! date_text)
      return context.implied_date();

    optional<date_t> when = try_parse_date(*date_text);
    if (! when)
      throw_(parse_error, _f("Unreadable date '%1%'") % *date_text);
    return when;
  }

  raw_fields_t begin_fields(const parser_t& parser,
                            const parse_context_t& context)
  {
    raw_fields_t fields;
    fields.linenum = context.linenum;
    fields.parser  = parser.name();
    return fields;
  }
}

bool credit_transfer_parser_t::can_parse(const string&          line,
                                         const parse_context_t&) const
{
  optional<string> date_text;
  string           text(strip_leading_date(line, date_text));

  boost::smatch what;
  if (! credit_line_mask.match_all(text, what))
    return false;

  string description(what[1]);
  return (credit_words_mask.match(description) &&
          ! fee_words_mask.match(description) &&
          ! amount_token_mask.match(description));
}

optional<raw_fields_t>
credit_transfer_parser_t::parse(const string&    line,
                                parse_context_t& context) const
{
  optional<string> date_text;
  string           text(strip_leading_date(line, date_text));

  boost::smatch what;
  if (! credit_line_mask.match_all(text, what))
    throw_(parse_error, _f("Not a credit line: %1%") % line);

  raw_fields_t fields(begin_fields(*this, context));

  fields.date        = line_date(date_text, context);
  fields.description = collapse_ws(what[1]);
  fields.credit      = parse_amount_column(what[2], "credit");
  fields.reference   = extract_reference(fields.description);

  return fields;
}

bool service_fee_parser_t::can_parse(const string&          line,
                                     const parse_context_t&) const
{
  bool has_marker = (line.find("##") != string::npos ||
                     contains_icase(line, "fee"));

  return (has_marker &&
          ! table_header_mask.match(line) &&
          fee_amount_end_mask.match(line));
}

optional<raw_fields_t>
service_fee_parser_t::parse(const string&    line,
                            parse_context_t& context) const
{
  optional<string> date_text;
  string           text(strip_leading_date(line, date_text));

  boost::smatch what;
  if (! fee_line_mask.match_all(text, what))
    throw_(parse_error, _f("Invalid service fee format: %1%") % line);

  raw_fields_t fields(begin_fields(*this, context));

  string details(what[1]);
  erase_all(details, "##");

  fields.date        = line_date(date_text, context);
  fields.description = collapse_ws(details);
  fields.service_fee = parse_amount_column(what[2], "service fee");
  if (what[3].matched)
    fields.balance   = parse_amount_column(what[3], "balance");
  fields.reference   = string("FEE");

  return fields;
}

bool debit_credit_parser_t::can_parse(const string&          line,
                                      const parse_context_t&) const
{
  optional<string> date_text;
  string           text(strip_leading_date(line, date_text));

  boost::smatch what;
  return (debit_credit_mask.match_all(text, what) &&
          letter_mask.match(string(what[1])));
}

optional<raw_fields_t>
debit_credit_parser_t::parse(const string&    line,
                             parse_context_t& context) const
{
  optional<string> date_text;
  string           text(strip_leading_date(line, date_text));

  boost::smatch what;
  if (! debit_credit_mask.match_all(text, what))
    throw_(parse_error, _f("Not a debit or credit line: %1%") % line);

  raw_fields_t fields(begin_fields(*this, context));

  fields.date        = line_date(date_text, context);
  fields.description = collapse_ws(what[1]);
  fields.reference   = extract_reference(fields.description);

  amount_t amt(*parse_amount_column(what[2], "amount"));
  string   marker(to_upper_copy(string(what[3])));

  bool is_debit;
  if (marker == "-" || marker == "DR") {
    is_debit = true;
  }
  else if (marker == "CR") {
    is_debit = false;
  }
  else {
    amount_t zero(0L);
    is_debit = determine_type(zero, zero, zero,
                              fields.description) != XACT_CREDIT;
  }

  if (is_debit)
    fields.debit = amt;
  else
    fields.credit = amt;

  if (what[4].matched) {
    amount_t balance(*parse_amount_column(what[4], "balance"));
    string   balance_marker(to_upper_copy(string(what[5])));
    if (balance_marker == "-" || balance_marker == "DR")
      balance.in_place_negate();
    fields.balance = balance;
  }

  DEBUG("parse.line", name() << ": \"" << fields.description << "\" "
        << (is_debit ? "debit " : "credit ") << amt);

  return fields;
}

} // namespace reckon
