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

#include "parser.h"
#include "tabular.h"
#include "lineparse.h"
#include "mask.h"

namespace reckon {

const parser_t * parser_chain_t::find_parser(const string&          line,
                                             const parse_context_t& context) const
{
  foreach (const parser_t& parser, parsers) {
    if (parser.can_parse(line, context)) {
      DEBUG("parse.chain", parser.name() << " accepts line "
            << context.linenum << ": " << line);
      return &parser;
    }
  }
  DEBUG("parse.chain", "No parser accepts line " << context.linenum
        << ": " << line);
  return NULL;
}

void add_standard_parsers(parser_chain_t& chain)
{
  chain.add_parser(new tabular_parser_t);
  chain.add_parser(new credit_transfer_parser_t);
  chain.add_parser(new service_fee_parser_t);
  chain.add_parser(new debit_credit_parser_t);
}

optional<string> extract_reference(const string& details)
{
  static const mask_t reference_mask("[0-9]{8,}");

  boost::smatch what;
  if (reference_mask.search(details, what))
    return string(what[0]);
  return none;
}

optional<amount_t> parse_amount_column(const string& text, const char * column)
{
  string field(trimmed(text));
  if (field.empty())
    return none;

  optional<amount_t> amt = parse_amount_text(field);
  if (! amt)
    throw_(parse_error, _f("Unreadable %1% column: '%2%'") % column % field);
  return amt;
}

} // namespace reckon
