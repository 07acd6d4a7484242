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

#include "context.h"
#include "config.h"
#include "mask.h"

namespace reckon {

namespace {
  const mask_t period_mask
    ("statement\\s+(?:period\\s*:?\\s*)?from\\s+(.+?)\\s+to\\s+(.+?)\\s*$");
  const mask_t statement_date_mask
    ("statement\\s+date\\s*:?\\s*(.+?)\\s*$");

  optional<date_t> make_date(const int year, const int month, const int day)
  {
    try {
      return date_t(static_cast<unsigned short>(year),
                    static_cast<unsigned short>(month),
                    static_cast<unsigned short>(day));
    }
    catch (const std::out_of_range&) {
      return none;
    }
  }

  long distance_from(const date_t& when, const date_t& begin,
                     const date_t& end)
  {
    if (when < begin)
      return (begin - when).days();
    else if (when > end)
      return (when - end).days();
    return 0;
  }
}

bool parse_context_t::scan_header(const string& line)
{
  boost::smatch what;

  if (period_mask.search(line, what)) {
    optional<date_t> begin = try_parse_date(what[1]);
    optional<date_t> end   = try_parse_date(what[2]);
    if (begin && end) {
      period_start = begin;
      period_end   = end;
      if (! statement_date)
        statement_date = end;

      INFO("Statement period " << format_date(*begin) << " to "
           << format_date(*end));
      return true;
    }
    DEBUG("parse.header", "Unreadable statement period: " << line);
  }

  if (statement_date_mask.search(line, what)) {
    optional<date_t> when = try_parse_date(what[1]);
    if (when) {
      if (! statement_date)
        statement_date = when;
      return true;
    }
  }
  return false;
}

date_t parse_context_t::resolve_month_day(const int month, const int day) const
{
  if (month < 1 || month > 12 || day < 1 || day > 31)
    throw_(date_error, _f("Invalid month/day: %1%/%2%") % month % day);

  if (period_start && period_end) {
    optional<date_t> best;
    long             best_distance = 0;

    for (int year = period_start->year(); year <= period_end->year(); year++) {
      optional<date_t> when = make_date(year, month, day);
      if (! when)
        continue;

      long distance = distance_from(*when, *period_start, *period_end);
      if (! best || distance < best_distance) {
        best          = when;
        best_distance = distance;
      }
    }
    if (best) {
      DEBUG("parse.dates", month << '/' << day << " resolved to "
            << format_date(*best) << " from the statement period");
      return *best;
    }
  }

  int year = statement_date ? int(statement_date->year()) : config.default_year;

  optional<date_t> when = make_date(year, month, day);
  if (! when)
    throw_(date_error, _f("Invalid date: %1%-%2%-%3%") % year % month % day);
  return *when;
}

} // namespace reckon
