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
 * @addtogroup report
 */

/**
 * @file   session.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief Statement ingestion: classify, parse, build, deduplicate, store.
 */
#pragma once

#include "parser.h"
#include "classify.h"
#include "dedup.h"

namespace reckon {

class config_t;

/**
 * A line which looked like a transaction but which no parser could read.
 */
struct unparsed_line_t
{
  std::size_t linenum;
  string      text;
  string      reason;

  unparsed_line_t(std::size_t _linenum, const string& _text,
                  const string& _reason)
    : linenum(_linenum), text(_text), reason(_reason) {}
};

struct build_failure_t
{
  std::size_t linenum;
  string      field;
  string      message;

  build_failure_t(std::size_t _linenum, const string& _field,
                  const string& _message)
    : linenum(_linenum), field(_field), message(_message) {}
};

struct accepted_xact_t
{
  long                id;
  std::size_t         linenum;
  standardized_xact_t xact;

  accepted_xact_t(long _id, std::size_t _linenum,
                  const standardized_xact_t& _xact)
    : id(_id), linenum(_linenum), xact(_xact) {}
};

struct duplicate_xact_t
{
  long                existing_id;
  std::size_t         linenum;
  standardized_xact_t xact;

  duplicate_xact_t(long _existing_id, std::size_t _linenum,
                   const standardized_xact_t& _xact)
    : existing_id(_existing_id), linenum(_linenum), xact(_xact) {}
};

struct import_result_t
{
  string                        source;
  std::vector<accepted_xact_t>  accepted;
  std::vector<duplicate_xact_t> duplicates;
  std::vector<unparsed_line_t>  unparsed;
  std::vector<build_failure_t>  build_errors;
  std::size_t                   noise_lines;
  std::size_t                   other_lines;

  import_result_t() : noise_lines(0), other_lines(0) {}
};

/**
 * How one line was treated, for diagnosing format drift.
 */
struct line_report_t
{
  std::size_t  linenum;
  line_class_t kind;
  bool         header;
  string       parser;
  string       error;
  string       text;

  line_report_t() : linenum(0), kind(LINE_OTHER), header(false) {}
};

/**
 * @class session_t
 *
 * @brief Drives the ingestion of statements into a transaction store.
 *
 * Lines are processed strictly in order, and each transaction is stored
 * before the next one is checked for duplicates.  Lines that cannot be
 * read are collected in the result; they never stop the statement.
 * Store failures do, and raise store_error with whatever was already
 * stored left in place.
 */
class session_t : public noncopyable
{
  const config_t&      config;
  transaction_store_t& store;
  parser_chain_t       chain;
  duplicate_checker_t  checker;

public:
  session_t(const config_t& _config, transaction_store_t& _store);

  parser_chain_t& parsers() {
    return chain;
  }

  /**
   * Ingest a statement, using the company, period and statement date
   * from the configuration.
   */
  import_result_t ingest(const std::vector<string>& lines,
                         const string&              source = "<input>");

  import_result_t ingest(const std::vector<string>& lines,
                         parse_context_t&           context);

  /**
   * Run the classifier and parser chain over a statement without
   * building or storing anything.
   */
  std::vector<line_report_t> classify(const std::vector<string>& lines,
                                      const string& source = "<input>");

protected:
  void process(const std::vector<string>&  lines,
               parse_context_t&            context,
               import_result_t&            result,
               std::vector<line_report_t> * reports);

  void flush_pending(parse_context_t& context, import_result_t& result);

  parse_context_t make_context(const string& source) const;
};

std::vector<string> read_lines(std::istream& in);

} // namespace reckon
