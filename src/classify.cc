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

#include "classify.h"
#include "mask.h"

namespace reckon {

namespace {
  // Page furniture and the bank's letterhead.
  const char * noise_words[] = {
    "page", "statement no", "vat reg", "po box", "p.o. box",
    "these fees include", NULL
  };

  // Balance summaries; noise unless the bank charged for something.
  const char * summary_words[] = {
    "account summary", "opening balance", "closing balance",
    "brought forward", "carried forward", NULL
  };

  bool contains_any_of(const string& text, const char ** words)
  {
    for (const char ** p = words; *p; p++)
      if (text.find(*p) != string::npos)
        return true;
    return false;
  }

  const char * transaction_keywords[] = {
    "transfer", "payment", "fee", "charge", "deposit", "withdrawal",
    "debit", "credit", "atm", "eft", "salary", "interest", "dividend", NULL
  };

  const mask_t amount_mask("[0-9]+\\.[0-9]{2}");

  const mask_t date_mask
    ("\\b(?:[0-9]{1,2}[/.-][0-9]{1,2}[/.-][0-9]{2,4}"
     "|[0-9]{4}-[0-9]{2}-[0-9]{2}"
     "|[0-9]{1,2}[ -](?:jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)"
     "[a-z]*[ -][0-9]{2,4})\\b");

  // A row of column titles, such as
  //   Details  Service Fee  Debits  Credits  Date  Balance
  const mask_t column_header_mask
    ("^\\s*(?:details|description|transaction|date)\\b.*"
     "\\b(?:balance|debits?|credits?|amount)\\s*$");
}

line_class_t classify_line(const string& line)
{
  line_class_t kind = LINE_OTHER;
  string       text(lowered(trimmed(line)));

  if (text.empty()) {
    kind = LINE_NOISE;
  }
  else {
    if (contains_any_of(text, noise_words) ||
        (contains_any_of(text, summary_words) &&
         text.find("fee") == string::npos &&
         text.find("charge") == string::npos))
      kind = LINE_NOISE;

    if (kind != LINE_NOISE) {
      if (column_header_mask.match(text) && ! amount_mask.match(text)) {
        kind = LINE_NOISE;
      }
      else if (amount_mask.match(text) || date_mask.match(text)) {
        kind = LINE_TRANSACTION;
      }
      else if (contains_any_of(text, transaction_keywords)) {
        kind = LINE_TRANSACTION;
      }
    }
  }

  DEBUG("classify.line", line_class_name(kind) << ": " << line);
  return kind;
}

const char * line_class_name(const line_class_t kind)
{
  switch (kind) {
  case LINE_NOISE:       return "noise";
  case LINE_TRANSACTION: return "transaction";
  case LINE_OTHER:       return "other";
  }
  return "unknown";
}

} // namespace reckon
