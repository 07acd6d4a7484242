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
 * @addtogroup parse
 */

/**
 * @file   context.h
 * @author John Wiegley
 *
 * @ingroup parse
 */
#pragma once

#include "utils.h"
#include "times.h"
#include "xact.h"

namespace reckon {

class config_t;

/**
 * State carried across the lines of a single statement.  Each ingestion
 * run owns exactly one of these; nothing in it is shared.
 */
class parse_context_t
{
public:
  const config_t& config;

  long             company_id;
  long             period_id;
  string           source;
  std::size_t      linenum;

  optional<date_t> statement_date;
  optional<date_t> period_start;
  optional<date_t> period_end;

  // A row which may still be extended by continuation lines
  optional<raw_fields_t> pending;
  bool                   last_was_tabular;

  // Running balance after the last row handed on for building
  optional<amount_t>     last_balance;

  explicit parse_context_t(const config_t& _config,
                           const string&   _source = "<input>")
    : config(_config), company_id(0), period_id(0), source(_source),
      linenum(0), last_was_tabular(false) {}

  string location() const {
    return file_context(source, linenum);
  }

  /**
   * Look for a "Statement from 16 February 2024 to 15 March 2024" header,
   * or a "Statement date: ..." line, and remember what it says.  Returns
   * true if the line was such a header.
   */
  bool scan_header(const string& line);

  /**
   * The full date for a row that only prints month and day.  The year
   * comes from the statement period when one is known (a date inside the
   * period wins, else the nearer candidate), else from the statement
   * date, else from the configured default year.
   */
  date_t resolve_month_day(const int month, const int day) const;

  /**
   * The date to use for a row that carries none.
   */
  optional<date_t> implied_date() const {
    return statement_date;
  }
};

} // namespace reckon
