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

#include "report.h"

namespace reckon {

void print_import_result(std::ostream& out, const import_result_t& result)
{
  out << result.source << ": "
      << result.accepted.size() << " accepted, "
      << result.duplicates.size() << " duplicate, "
      << result.unparsed.size() << " unparsed, "
      << result.build_errors.size() << " incomplete, "
      << result.noise_lines << " skipped\n";

  if (! result.accepted.empty()) {
    out << "\nAccepted:\n";
    foreach (const accepted_xact_t& accepted, result.accepted)
      out << boost::format("%6d  ") % accepted.id << accepted.xact << '\n';
  }

  if (! result.duplicates.empty()) {
    out << "\nDuplicates (already imported):\n";
    foreach (const duplicate_xact_t& dup, result.duplicates)
      out << boost::format("  line %-5d of #%-6d ") % dup.linenum
        % dup.existing_id << dup.xact << '\n';
  }

  if (! result.unparsed.empty()) {
    out << "\nUnparsed lines:\n";
    foreach (const unparsed_line_t& line, result.unparsed)
      out << boost::format("  line %-5d %s\n    %s\n") % line.linenum
        % line.reason % line.text;
  }

  if (! result.build_errors.empty()) {
    out << "\nIncomplete transactions:\n";
    foreach (const build_failure_t& failure, result.build_errors)
      out << boost::format("  line %-5d missing %s: %s\n")
        % failure.linenum % failure.field % failure.message;
  }
}

void print_line_reports(std::ostream&                     out,
                        const std::vector<line_report_t>& reports)
{
  foreach (const line_report_t& report, reports) {
    string kind(report.header ? "header" : line_class_name(report.kind));
    string parser(report.parser.empty() ? string("-") : report.parser);

    out << boost::format("%5d  %-11s %-15s %s\n")
      % report.linenum % kind % parser % report.text;
    if (! report.error.empty())
      out << "       error: " << report.error << '\n';
  }
}

void print_trial_balance(std::ostream& out, const trial_balance_t& tb)
{
  out << boost::format("Trial balance: company %d, fiscal period %d\n\n")
    % tb.company_id % tb.period_id;

  out << boost::format("%-8s %-30s %s %14s %14s %14s %14s %14s\n")
    % "Code" % "Account" % "N" % "Opening" % "Debits" % "Credits"
    % "TB Debit" % "TB Credit";

  foreach (const account_balance_t& account, tb.accounts)
    out << boost::format("%-8s %-30s %c %14s %14s %14s %14s %14s\n")
      % account.account_code % account.account_name
      % char(account.normal_balance)
      % account.opening_balance % account.period_debits
      % account.period_credits % account.trial_balance_debit()
      % account.trial_balance_credit();

  out << boost::format("%-86s %14s %14s\n")
    % "Total" % tb.total_debit % tb.total_credit;

  if (tb.balanced)
    out << "\nThe trial balance balances.\n";
  else
    out << "\nThe trial balance is out by " << tb.difference().abs()
        << ": " << tb.direction() << ".\n";
}

} // namespace reckon
