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
 * @file   tabular.h
 * @author John Wiegley
 *
 * @ingroup parse
 *
 * @brief Rows of a columnar bank statement.
 *
 * The columns are always details, service fee, debits, credits, date and
 * balance.  They reach us in one of three physical shapes:
 *
 *   - tab-delimited, with five columns (no service fee) or six;
 *   - fixed-width, as laid out on the printed page;
 *   - compact, where extraction has squeezed out the padding:
 *     @code
 *     IB PAYMENT TO ACME SUPPLIES 1,200.00- 03 15 45,300.00
 *     MONTHLY MANAGEMENT FEE ## 60.00- 03 15 45,240.00
 *     @endcode
 *
 * A row may be followed by continuation lines, which are appended to its
 * description.
 */
#pragma once

#include "parser.h"

namespace reckon {

class tabular_parser_t : public parser_t
{
public:
  enum shape_t {
    SHAPE_TABBED,
    SHAPE_FIXED,
    SHAPE_COMPACT,
    SHAPE_CONTINUATION
  };

  // Fixed-width column boundaries
  static const std::size_t DETAILS_END      = 55;
  static const std::size_t SERVICE_FEE_END  = 70;
  static const std::size_t DEBITS_END       = 95;
  static const std::size_t CREDITS_END      = 115;
  static const std::size_t DATE_END         = 125;
  static const std::size_t BALANCE_END      = 135;

  virtual const char * name() const {
    return "tabular";
  }

  virtual bool can_parse(const string&          line,
                         const parse_context_t& context) const {
    return static_cast<bool>(shape_of(line, context));
  }

  virtual optional<raw_fields_t> parse(const string&    line,
                                       parse_context_t& context) const;

  virtual bool is_tabular() const {
    return true;
  }

  optional<shape_t> shape_of(const string&          line,
                             const parse_context_t& context) const;

protected:
  raw_fields_t parse_tabbed(const string& line, parse_context_t& context) const;
  raw_fields_t parse_fixed(const string& line, parse_context_t& context) const;
  raw_fields_t parse_compact(const string& line, parse_context_t& context) const;
  void         append_continuation(const string& line,
                                   parse_context_t& context) const;

  optional<date_t> parse_date_column(const string& text,
                                     const parse_context_t& context) const;
};

} // namespace reckon
