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
 * @file   lineparse.h
 * @author John Wiegley
 *
 * @ingroup parse
 *
 * @brief Parsers for free-standing statement lines.
 *
 * Each of these reads one line with an optional leading date.  A line
 * without a date takes the statement date from the parse context.
 */
#pragma once

#include "parser.h"

namespace reckon {

/**
 * Incoming money described in words:
 * @code
 * CREDIT TRANSFER FROM JOHN DOE 1,500.00
 * DEPOSIT REF 123456 500.00
 * @endcode
 * Lines whose amount carries a trailing minus, or that mention a fee,
 * are left for other parsers.
 */
class credit_transfer_parser_t : public parser_t
{
public:
  virtual const char * name() const {
    return "credit-transfer";
  }

  virtual bool can_parse(const string&          line,
                         const parse_context_t& context) const;

  virtual optional<raw_fields_t> parse(const string&    line,
                                       parse_context_t& context) const;
};

/**
 * Bank charges marked by "FEE" or "##", ending in an amount:
 * @code
 * SERVICE FEE 35.00-
 * MONTHLY FEE ## 60.00
 * @endcode
 * The amount is taken as the service fee, and the reference is "FEE".
 */
class service_fee_parser_t : public parser_t
{
public:
  virtual const char * name() const {
    return "service-fee";
  }

  virtual bool can_parse(const string&          line,
                         const parse_context_t& context) const;

  virtual optional<raw_fields_t> parse(const string&    line,
                                       parse_context_t& context) const;
};

/**
 * The catch-all: DESCRIPTION AMOUNT [BALANCE].  A trailing "-" or "DR"
 * makes the amount a debit and "CR" a credit; with neither, the
 * description's keywords decide.
 */
class debit_credit_parser_t : public parser_t
{
public:
  virtual const char * name() const {
    return "debit-credit";
  }

  virtual bool can_parse(const string&          line,
                         const parse_context_t& context) const;

  virtual optional<raw_fields_t> parse(const string&    line,
                                       parse_context_t& context) const;
};

} // namespace reckon
