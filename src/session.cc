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

#include "session.h"
#include "config.h"

namespace reckon {

session_t::session_t(const config_t& _config, transaction_store_t& _store)
  : config(_config), store(_store), checker(_store)
{
  add_standard_parsers(chain);
}

parse_context_t session_t::make_context(const string& source) const
{
  parse_context_t context(config, source);
  context.company_id     = config.company_id;
  context.period_id      = config.period_id;
  context.statement_date = config.statement_date;
  return context;
}

import_result_t session_t::ingest(const std::vector<string>& lines,
                                  const string&              source)
{
  parse_context_t context(make_context(source));
  return ingest(lines, context);
}

import_result_t session_t::ingest(const std::vector<string>& lines,
                                  parse_context_t&           context)
{
  INFO_START(ingest, "Ingested " << context.source);

  import_result_t result;
  result.source = context.source;

  process(lines, context, result, NULL);

  INFO_FINISH(ingest);
  INFO(context.source << ": " << result.accepted.size() << " accepted, "
       << result.duplicates.size() << " duplicates, "
       << result.unparsed.size() << " unparsed, "
       << result.build_errors.size() << " incomplete");

  return result;
}

std::vector<line_report_t>
session_t::classify(const std::vector<string>& lines, const string& source)
{
  parse_context_t            context(make_context(source));
  import_result_t            result;
  std::vector<line_report_t> reports;

  process(lines, context, result, &reports);

  return reports;
}

void session_t::process(const std::vector<string>&  lines,
                        parse_context_t&            context,
                        import_result_t&            result,
                        std::vector<line_report_t> * reports)
{
  foreach (const string& line, lines) {
    context.linenum++;
    check_for_signal();

    line_report_t report;
    report.linenum = context.linenum;
    report.text    = line;

    if (context.scan_header(line)) {
      report.kind   = LINE_NOISE;
      report.header = true;
      if (reports)
        reports->push_back(report);

      result.noise_lines++;
      context.last_was_tabular = false;
      continue;
    }

    report.kind = classify_line(line);

    if (report.kind == LINE_NOISE) {
      if (reports)
        reports->push_back(report);

      result.noise_lines++;
      if (! trimmed(line).empty())
        context.last_was_tabular = false;
      continue;
    }

    const parser_t * parser = chain.find_parser(line, context);

    if (! parser) {
      if (report.kind == LINE_TRANSACTION) {
        report.error = _("no parser accepts this line");
        result.unparsed.push_back(unparsed_line_t(context.linenum, line,
                                                  report.error));
        DEBUG("import", "Unparsed line " << context.linenum << ": " << line);
      } else {
        result.other_lines++;
      }
      if (reports)
        reports->push_back(report);

      context.last_was_tabular = false;
      continue;
    }

    report.parser = parser->name();

    try {
      optional<raw_fields_t> fields = parser->parse(line, context);
      if (fields) {
        if (! reports)
          flush_pending(context, result);
        context.pending = fields;
      }
      context.last_was_tabular = parser->is_tabular();
    }
    catch (const parse_error& err) {
      report.error = err.what();
    }
    catch (const amount_error& err) {
      report.error = err.what();
    }
    catch (const date_error& err) {
      report.error = err.what();
    }

    if (! report.error.empty()) {
      result.unparsed.push_back(unparsed_line_t(context.linenum, line,
                                                report.error));
      context.last_was_tabular = false;
      DEBUG("import", context.location() << " " << report.error);
    }

    if (reports)
      reports->push_back(report);
  }

  if (! reports)
    flush_pending(context, result);
}

void session_t::flush_pending(parse_context_t& context,
                              import_result_t& result)
{
  if (! context.pending)
    return;

  raw_fields_t fields(*context.pending);
  context.pending = none;

  if (! fields.balance && context.last_balance) {
    amount_t balance(*context.last_balance);
    balance += value_or_zero(fields.credit).abs();
    balance -= value_or_zero(fields.debit).abs();
    balance -= value_or_zero(fields.service_fee).abs();
    fields.balance = balance;

    DEBUG("import", "Derived balance " << balance << " for line "
          << fields.linenum);
  }

  optional<standardized_xact_t> xact;
  try {
    xact = standardized_xact_t::build(fields);
  }
  catch (const build_error& err) {
    result.build_errors.push_back(build_failure_t(fields.linenum,
                                                  err.field(), err.what()));
    DEBUG("import", "Incomplete transaction at line " << fields.linenum
          << ": " << err.what());
    return;
  }

  if (xact->balance())
    context.last_balance = xact->balance();

  // A row that moves no money still anchors the running balance, but is
  // not a transaction.
  if (xact->amount().is_zero()) {
    result.build_errors.push_back
      (build_failure_t(fields.linenum, "amount",
                       _("Transaction has no amount")));
    DEBUG("import", "No amount for line " << fields.linenum);
    return;
  }

  bank_xact_t row(bank_xact_t::from(*xact, context.company_id,
                                    context.period_id));

  if (optional<bank_xact_t> existing = checker.find_duplicate(&row)) {
    result.duplicates.push_back(duplicate_xact_t(existing->id,
                                                 fields.linenum, *xact));
    INFO("Line " << fields.linenum << " duplicates transaction "
         << existing->id << ": " << xact->description());
    return;
  }

  long id = store.insert(row);
  result.accepted.push_back(accepted_xact_t(id, fields.linenum, *xact));

  DEBUG("import", "Accepted line " << fields.linenum << " as transaction "
        << id << ": " << *xact);
}

std::vector<string> read_lines(std::istream& in)
{
  std::vector<string> lines;
  string              line;
  while (std::getline(in, line)) {
    if (! line.empty() && line[line.length() - 1] == '\r')
      line.erase(line.length() - 1);
    lines.push_back(line);
  }
  return lines;
}

} // namespace reckon
