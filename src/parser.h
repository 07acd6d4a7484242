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
 * @file   parser.h
 * @author John Wiegley
 *
 * @ingroup parse
 *
 * @brief The statement line parsers and the chain that selects among them.
 */
#pragma once

#include "context.h"

namespace reckon {

DECLARE_EXCEPTION(parse_error, std::runtime_error);

/**
 * @class parser_t
 *
 * @brief One recognizable shape of statement line.
 *
 * can_parse() must not change the context.  parse() either returns the
 * fields of a new row, or returns none when the line only extended the
 * row held in `context.pending'.  A line that can_parse() accepted but
 * that turns out to be unreadable raises parse_error.
 */
class parser_t : public noncopyable
{
public:
  virtual ~parser_t() {}

  virtual const char * name() const = 0;

  virtual bool can_parse(const string&          line,
                         const parse_context_t& context) const = 0;

  virtual optional<raw_fields_t> parse(const string&    line,
                                       parse_context_t& context) const = 0;

  /**
   * True if rows produced by this parser may be followed by
   * continuation lines.
   */
  virtual bool is_tabular() const {
    return false;
  }
};

/**
 * @class parser_chain_t
 *
 * @brief Parsers in priority order; the first that accepts a line wins.
 */
class parser_chain_t : public noncopyable
{
  typedef boost::ptr_vector<parser_t> parsers_list;

  parsers_list parsers;

public:
  typedef parsers_list::const_iterator const_iterator;

  parser_chain_t() {}

  /**
   * Append a parser, taking ownership of it.
   */
  void add_parser(parser_t * parser) {
    parsers.push_back(parser);
  }

  const parser_t * find_parser(const string&          line,
                               const parse_context_t& context) const;

  const_iterator begin() const {
    return parsers.begin();
  }
  const_iterator end() const {
    return parsers.end();
  }
  std::size_t size() const {
    return parsers.size();
  }
};

/**
 * Install the standard parsers, most specific first: tabular rows,
 * credit transfers, service fees, then generic debit/credit lines.
 */
void add_standard_parsers(parser_chain_t& chain);

/**
 * The first run of eight or more digits in `details', if any.
 */
optional<string> extract_reference(const string& details);

/**
 * Read a monetary column, raising parse_error if it is not empty and
 * not an amount.
 */
optional<amount_t> parse_amount_column(const string& text, const char * column);

} // namespace reckon
